#include <segmd/segments/trajectory.hpp>

#include <ostream>
#include <stdexcept>
#include <utility>

namespace segmd::segments {

struct trajectory::data {
    std::filesystem::path structure_file;
    std::vector<std::filesystem::path> trajectory_files;
    std::size_t frames;
    std::optional<step_range> steps;
};

trajectory::trajectory(std::shared_ptr<const data> d) : data_{std::move(d)} {}

trajectory trajectory::create(std::filesystem::path structure_file,
                              std::vector<std::filesystem::path> trajectory_files,
                              std::size_t frames,
                              std::optional<step_range> steps) {
    if (trajectory_files.empty()) {
        throw std::invalid_argument{"trajectory requires at least one trajectory file"};
    }
    if (steps && steps->last < steps->first) {
        throw std::invalid_argument{"trajectory step range must not decrease"};
    }
    return trajectory{std::make_shared<const data>(
        data{std::move(structure_file), std::move(trajectory_files), frames, std::move(steps)})};
}

trajectory trajectory::create(std::filesystem::path structure_file,
                              std::filesystem::path trajectory_file,
                              std::size_t frames,
                              std::optional<step_range> steps) {
    std::vector<std::filesystem::path> files;
    files.push_back(std::move(trajectory_file));
    return create(std::move(structure_file), std::move(files), frames, std::move(steps));
}

std::size_t trajectory::size() const noexcept {
    return data_->frames;
}

bool trajectory::empty() const noexcept {
    return data_->frames == 0;
}

const std::filesystem::path& trajectory::structure_file() const noexcept {
    return data_->structure_file;
}

const std::vector<std::filesystem::path>& trajectory::trajectory_files() const noexcept {
    return data_->trajectory_files;
}

const std::optional<trajectory::step_range>& trajectory::steps() const noexcept {
    return data_->steps;
}

bool operator==(const trajectory& a, const trajectory& b) noexcept {
    if (a.data_ == b.data_) {
        return true;
    }
    return a.size() == b.size() && a.structure_file() == b.structure_file() && a.trajectory_files() == b.trajectory_files();
}

std::ostream& operator<<(std::ostream& os, const trajectory& traj) {
    os << "trajectory(";
    const auto& files = traj.trajectory_files();
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (i != 0) {
            os << ", ";
        }
        os << files[i].string();
    }
    os << "; structure " << traj.structure_file().string() << "; " << traj.size() << " frames";
    if (const auto& steps = traj.steps()) {
        os << "; steps " << steps->first << "-" << steps->last;
    }
    return os << ")";
}

}  // namespace segmd::segments
