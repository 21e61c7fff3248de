#include <segmd/segments/frame_locator.hpp>

#include <sstream>

#if __has_include(<xtensor/generators/xbuilder.hpp>)
#include <xtensor/generators/xbuilder.hpp>
#else
#include <xtensor/xbuilder.hpp>
#endif

#if __has_include(<xtensor/views/xview.hpp>)
#include <xtensor/views/xview.hpp>
#else
#include <xtensor/xview.hpp>
#endif

namespace segmd::segments {

inconsistent_condition_shape::inconsistent_condition_shape(const std::string& what) : std::logic_error{what} {}

frame_address address_of_global_frame(std::span<const std::size_t> part_lengths, std::size_t global_frame) {
    std::size_t preceding = 0;
    for (std::size_t segment = 0; segment < part_lengths.size(); ++segment) {
        if (global_frame < preceding + part_lengths[segment]) {
            return {segment, global_frame - preceding};
        }
        preceding += part_lengths[segment];
    }

    std::ostringstream buffer;
    buffer << "global frame " << global_frame << " is beyond the " << preceding << " frames of " << part_lengths.size()
           << " segments";
    throw std::out_of_range{buffer.str()};
}

std::size_t global_frame_of_address(std::span<const std::size_t> part_lengths, frame_address address) {
    if (address.segment >= part_lengths.size() || address.frame >= part_lengths[address.segment]) {
        throw std::out_of_range{"frame address does not name a frame of the given segments"};
    }
    std::size_t preceding = 0;
    for (std::size_t segment = 0; segment < address.segment; ++segment) {
        preceding += part_lengths[segment];
    }
    return preceding + address.frame;
}

condition_matrix make_condition_matrix(const std::vector<condition_values>& values, std::size_t frames) {
    condition_matrix matrix = xt::zeros<bool>({values.size(), frames});
    for (std::size_t c = 0; c < values.size(); ++c) {
        if (values[c].dimension() != 1 || values[c].shape()[0] != frames) {
            std::ostringstream buffer;
            buffer << "values of condition " << c << " have " << values[c].size() << " entries in " << values[c].dimension()
                   << " dimensions, expected one entry per frame (" << frames << ")";
            throw inconsistent_condition_shape{buffer.str()};
        }
        xt::view(matrix, c, xt::all()) = values[c];
    }
    return matrix;
}

std::vector<std::size_t> part_lengths_of(const std::vector<condition_matrix>& matrices) {
    std::vector<std::size_t> lengths;
    lengths.reserve(matrices.size());
    for (const auto& m : matrices) {
        if (m.dimension() != 2) {
            throw inconsistent_condition_shape{"condition matrix must be 2-dimensional (conditions x frames)"};
        }
        lengths.push_back(m.shape()[1]);
    }
    return lengths;
}

std::optional<first_true_frame> locate_first_true_frame(const std::vector<condition_matrix>& matrices) {
    const auto lengths = part_lengths_of(matrices);
    if (matrices.empty()) {
        return std::nullopt;
    }

    const std::size_t num_conditions = matrices.front().shape()[0];
    for (const auto& m : matrices) {
        if (m.shape()[0] != num_conditions) {
            throw inconsistent_condition_shape{"condition matrices disagree on the number of conditions"};
        }
    }

    // Scanning frame-major is the same as taking the minimum frame index over
    // the concatenated matrix and breaking ties on the lowest condition row.
    std::size_t preceding = 0;
    for (std::size_t segment = 0; segment < matrices.size(); ++segment) {
        const auto& m = matrices[segment];
        for (std::size_t frame = 0; frame < lengths[segment]; ++frame) {
            for (std::size_t condition = 0; condition < num_conditions; ++condition) {
                if (m(condition, frame)) {
                    return first_true_frame{condition, preceding + frame, {segment, frame}};
                }
            }
        }
        preceding += lengths[segment];
    }
    return std::nullopt;
}

}  // namespace segmd::segments
