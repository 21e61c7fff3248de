#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <segmd/segments/trajectory.hpp>

namespace segmd::propagation {

using segments::trajectory;

///
/// Engine configuration as mdp-style key/value pairs.
///
/// Keys are compared with '-' and '_' treated as the same character, so
/// `nstxout_compressed` and `nstxout-compressed` name the same option.
///
class md_config {
   public:
    md_config();

    ///
    /// Constructs from key/value pairs.
    ///
    explicit md_config(const std::map<std::string, std::string>& values);

    ///
    /// Sets an option, replacing any previous value.
    ///
    md_config& set(std::string_view key, std::string value);

    ///
    /// Gets the raw value of an option.
    ///
    std::optional<std::string> find(std::string_view key) const;

    ///
    /// Gets an option parsed as an integer, ignoring surrounding whitespace.
    ///
    /// @throws std::invalid_argument if the option is present but not an integer
    ///
    std::optional<std::int64_t> find_integer(std::string_view key) const;

    ///
    /// Gets the number of options.
    ///
    std::size_t size() const noexcept;

   private:
    static std::string normalize_(std::string_view key);

    std::map<std::string, std::string, std::less<>> values_;
};

///
/// Gets the number of integration steps between two output frames.
///
/// For `xtc` output this is `nstxout-compressed`; for `trr` output it is the
/// smallest positive value of `nstxout`, `nstvout` and `nstfout`.
///
/// @param config Engine configuration
/// @param output_traj_type Output trajectory type (file extension)
/// @return Output frequency in steps
/// @throws std::invalid_argument if the type is unknown or no positive output frequency is set
///
std::uint64_t output_frequency(const md_config& config, std::string_view output_traj_type);

///
/// MD engine collaborator.
///
/// One instance serves exactly one propagation. Calls block until the engine
/// has finished the requested work; run propagations on their own threads to
/// overlap them.
///
class md_engine {
   public:
    ///
    /// Walltime, in hours.
    ///
    using hours = std::chrono::duration<double, std::ratio<3600>>;

    virtual ~md_engine();

    ///
    /// Prepares a fresh run from a starting configuration.
    ///
    virtual void prepare(const trajectory& starting_configuration,
                         const std::filesystem::path& workdir,
                         const std::string& deffnm) = 0;

    ///
    /// Re-attaches to an existing run with the same working directory and deffnm.
    ///
    virtual void prepare_from_files(const std::filesystem::path& workdir, const std::string& deffnm) = 0;

    ///
    /// Runs for at most the given walltime and returns the segment produced.
    ///
    /// Implementations set the segment's trajectory::step_range to the steps
    /// of its first and last frame.
    ///
    virtual trajectory run_for_duration(hours walltime) = 0;

    ///
    /// Gets the number of integration steps done so far, including earlier segments.
    ///
    virtual std::uint64_t steps_done() const = 0;

    ///
    /// Gets the output trajectory type (file extension) of produced segments.
    ///
    virtual std::string output_traj_type() const = 0;

    ///
    /// Opens an existing segment file written by this engine type.
    ///
    virtual trajectory open_segment(const std::filesystem::path& trajectory_file) const = 0;
};

///
/// Creates engines for propagations and describes their configuration.
///
class md_engine_factory {
   public:
    virtual ~md_engine_factory();

    ///
    /// Creates a new, unprepared engine.
    ///
    virtual std::unique_ptr<md_engine> create() const = 0;

    ///
    /// Gets the configuration every created engine runs with.
    ///
    virtual const md_config& config() const = 0;

    ///
    /// Gets the output trajectory type of created engines.
    ///
    virtual std::string output_traj_type() const = 0;
};

///
/// Recovers the segments an earlier run left in a folder, in production order.
///
using segment_discovery =
    std::function<std::vector<trajectory>(const std::filesystem::path& folder, const std::string& deffnm, const md_engine& engine)>;

///
/// Gets the canonical file name of a segment, e.g. `run.part0001.xtc`.
///
/// @param deffnm Run name
/// @param part Part number, starting at 1
/// @param output_traj_type File extension
///
std::string part_file_name(const std::string& deffnm, std::uint32_t part, const std::string& output_traj_type);

///
/// Default segment discovery.
///
/// Lists files named `<deffnm>.partNNNN.<type>` in the folder, where type is
/// the engine's output trajectory type, orders them by part number and opens
/// each with md_engine::open_segment(). Files whose part number does not fit
/// a 32-bit counter are skipped with a warning.
///
/// @throws std::invalid_argument if folder is not a directory
///
std::vector<trajectory> discover_part_files(const std::filesystem::path& folder, const std::string& deffnm, const md_engine& engine);

}  // namespace segmd::propagation
