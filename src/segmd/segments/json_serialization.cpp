#include <segmd/segments/json_serialization.hpp>

#include <ostream>

#include <json/json.h>

namespace segmd::segments {

namespace {

Json::Value serialize_slice(const slice& s) {
    Json::Value result(Json::objectValue);
    result["structure_file"] = s.segment.structure_file().string();

    Json::Value files(Json::arrayValue);
    for (const auto& f : s.segment.trajectory_files()) {
        files.append(f.string());
    }
    result["trajectory_files"] = std::move(files);

    result["segment_frames"] = static_cast<Json::UInt64>(s.segment.size());
    result["start"] = static_cast<Json::UInt64>(s.start);
    if (s.stop) {
        result["stop"] = static_cast<Json::UInt64>(*s.stop);
    } else {
        result["stop"] = Json::Value::null;
    }
    result["stride"] = s.stride;
    result["frames"] = static_cast<Json::UInt64>(s.frame_count());
    return result;
}

Json::Value serialize_plan(const slice_plan& plan) {
    Json::Value root(Json::objectValue);
    root["total_frames"] = static_cast<Json::UInt64>(total_frames(plan));

    Json::Value slices(Json::arrayValue);
    slices.resize(static_cast<Json::ArrayIndex>(plan.size()));
    for (std::size_t i = 0; i < plan.size(); ++i) {
        slices[static_cast<Json::ArrayIndex>(i)] = serialize_slice(plan[i]);
    }
    root["slices"] = std::move(slices);
    return root;
}

}  // namespace

std::string serialize_slice_plan_to_json(const slice_plan& plan) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, serialize_plan(plan));
}

void write_slice_plan_json(std::ostream& out, const slice_plan& plan) {
    out << serialize_slice_plan_to_json(plan);
}

}  // namespace segmd::segments
