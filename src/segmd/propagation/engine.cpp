#include <segmd/propagation/engine.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/trivial.hpp>
#include <boost/numeric/conversion/cast.hpp>

namespace segmd::propagation {

md_config::md_config() = default;

md_config::md_config(const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        set(key, value);
    }
}

std::string md_config::normalize_(std::string_view key) {
    std::string normalized{key};
    std::replace(normalized.begin(), normalized.end(), '_', '-');
    return normalized;
}

md_config& md_config::set(std::string_view key, std::string value) {
    values_.insert_or_assign(normalize_(key), std::move(value));
    return *this;
}

std::optional<std::string> md_config::find(std::string_view key) const {
    const auto it = values_.find(normalize_(key));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::int64_t> md_config::find_integer(std::string_view key) const {
    const auto value = find(key);
    if (!value) {
        return std::nullopt;
    }
    // mdp files commonly pad values with blanks.
    std::int64_t parsed = 0;
    if (!boost::conversion::try_lexical_convert(boost::algorithm::trim_copy(*value), parsed)) {
        throw std::invalid_argument{str(boost::format("option `%1%` is not an integer: '%2%'") % key % *value)};
    }
    return parsed;
}

std::size_t md_config::size() const noexcept {
    return values_.size();
}

std::uint64_t output_frequency(const md_config& config, std::string_view output_traj_type) {
    if (output_traj_type == "xtc") {
        const auto nst = config.find_integer("nstxout-compressed");
        if (!nst || *nst <= 0) {
            throw std::invalid_argument{"xtc output requires a positive nstxout-compressed"};
        }
        return boost::numeric_cast<std::uint64_t>(*nst);
    }

    if (output_traj_type == "trr") {
        // A trr frame is written whenever any of positions, velocities or forces are due.
        std::uint64_t nstout = std::numeric_limits<std::uint64_t>::max();
        for (const auto* key : {"nstxout", "nstvout", "nstfout"}) {
            const auto nst = config.find_integer(key);
            if (nst && *nst > 0) {
                nstout = std::min(nstout, boost::numeric_cast<std::uint64_t>(*nst));
            }
        }
        if (nstout == std::numeric_limits<std::uint64_t>::max()) {
            throw std::invalid_argument{"trr output requires a positive nstxout, nstvout or nstfout"};
        }
        return nstout;
    }

    throw std::invalid_argument{str(boost::format("unknown output trajectory type '%1%'") % output_traj_type)};
}

md_engine::~md_engine() = default;

md_engine_factory::~md_engine_factory() = default;

std::string part_file_name(const std::string& deffnm, std::uint32_t part, const std::string& output_traj_type) {
    return str(boost::format("%1%.part%2$04d.%3%") % deffnm % part % output_traj_type);
}

std::vector<trajectory> discover_part_files(const std::filesystem::path& folder, const std::string& deffnm, const md_engine& engine) {
    if (!std::filesystem::is_directory(folder)) {
        throw std::invalid_argument{"segment folder '" + folder.string() + "' is not a directory"};
    }

    const std::string prefix = deffnm + ".part";
    const std::string suffix = "." + engine.output_traj_type();

    std::vector<std::pair<std::uint32_t, std::filesystem::path>> parts;
    for (const auto& entry : std::filesystem::directory_iterator{folder}) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (name.size() <= prefix.size() + suffix.size() || !name.starts_with(prefix) || !name.ends_with(suffix)) {
            continue;
        }
        const std::string number = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
        if (number.size() < 4 || !std::all_of(number.begin(), number.end(), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        std::uint32_t part = 0;
        if (!boost::conversion::try_lexical_convert(number, part)) {
            BOOST_LOG_TRIVIAL(warning) << "ignoring " << entry.path() << ": part number out of range";
            continue;
        }
        parts.emplace_back(part, entry.path());
    }
    std::sort(parts.begin(), parts.end());

    std::vector<trajectory> segments;
    segments.reserve(parts.size());
    for (const auto& [part, path] : parts) {
        segments.push_back(engine.open_segment(path));
    }
    BOOST_LOG_TRIVIAL(debug) << "found " << segments.size() << " existing segments for `" << deffnm << "` in " << folder;
    return segments;
}

}  // namespace segmd::propagation
