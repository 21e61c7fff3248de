#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

namespace segmd::segments {

///
/// Immutable handle to an ordered, finite sequence of MD frames.
///
/// A trajectory is backed by a structure file and one or more trajectory
/// container files. The handle never reads the files itself; the frame count
/// is supplied by whoever produced the trajectory (the engine or the
/// concatenator). Copies share the same underlying description.
///
/// **Note**: Cannot be default-constructed. Must be created via trajectory::create().
///
class trajectory {
   public:
    ///
    /// Integration steps of the first and last frame, when the producer knows them.
    ///
    struct step_range {
        std::uint64_t first;  ///< Step of frame 0
        std::uint64_t last;   ///< Step of the final frame
    };

    ///
    /// Creates a trajectory handle.
    ///
    /// @param structure_file Structure (topology/coordinates) file
    /// @param trajectory_files Container files, in frame order
    /// @param frames Number of frames across all container files
    /// @param steps Optional integration steps of the first and last frame
    /// @return Trajectory handle
    /// @throws std::invalid_argument if trajectory_files is empty, or if steps
    ///         are given with last < first
    ///
    [[nodiscard]] static trajectory create(std::filesystem::path structure_file,
                                           std::vector<std::filesystem::path> trajectory_files,
                                           std::size_t frames,
                                           std::optional<step_range> steps = std::nullopt);

    ///
    /// Convenience overload for a single container file.
    ///
    [[nodiscard]] static trajectory create(std::filesystem::path structure_file,
                                           std::filesystem::path trajectory_file,
                                           std::size_t frames,
                                           std::optional<step_range> steps = std::nullopt);

    ///
    /// Gets number of frames.
    ///
    /// @return Frame count
    ///
    std::size_t size() const noexcept;

    ///
    /// Gets whether the trajectory holds no frames.
    ///
    bool empty() const noexcept;

    ///
    /// Gets the structure file.
    ///
    const std::filesystem::path& structure_file() const noexcept;

    ///
    /// Gets the trajectory container files, in frame order.
    ///
    const std::vector<std::filesystem::path>& trajectory_files() const noexcept;

    ///
    /// Gets the integration steps of the first and last frame, if known.
    ///
    const std::optional<step_range>& steps() const noexcept;

    friend bool operator==(const trajectory& a, const trajectory& b) noexcept;

   private:
    struct data;

    explicit trajectory(std::shared_ptr<const data> d);

    std::shared_ptr<const data> data_;
};

///
/// Writes a short human readable description (files and frame count).
///
std::ostream& operator<<(std::ostream& os, const trajectory& traj);

}  // namespace segmd::segments
