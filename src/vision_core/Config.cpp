#include "posture/vision/Config.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iostream>

using nlohmann::json;

namespace vision {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, float& v)       { if (n[key]) v = n[key].as<float>(); }
static void try_get(const YAML::Node& n, const char* key, double& v)      { if (n[key]) v = n[key].as<double>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

PostureConfig PostureConfig::fromYaml(const std::string& yaml_path) {
    PostureConfig c;
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "listen_host", c.listen_host);
        try_get(r, "listen_port", c.listen_port);
        try_get(r, "server_name", c.server_name);
        try_get(r, "db_path",     c.db_path);

        try_get(r, "model_path",          c.model_path);
        try_get(r, "input_w",             c.input_w);
        try_get(r, "input_h",             c.input_h);
        try_get(r, "conf_thres_person",   c.conf_thres_person);
        try_get(r, "conf_thres_keypoint", c.conf_thres_keypoint);
        try_get(r, "fake_infer",          c.fake_infer);
        try_get(r, "intra_threads",       c.intra_threads);

        try_get(r, "min_frame_w", c.min_frame_w);
        try_get(r, "min_frame_h", c.min_frame_h);
        try_get(r, "stats_every_n_frames",  c.stats_every_n_frames);
        try_get(r, "annotated_jpg_quality", c.annotated_jpg_quality);

        if (const YAML::Node t = r["thresholds"]) {
            try_get(t, "neck_angle",    c.thresholds.neck_angle);
            try_get(t, "spine_tilt",    c.thresholds.spine_tilt);
            try_get(t, "shoulder_tilt", c.thresholds.shoulder_tilt);
            try_get(t, "tolerance",     c.thresholds.tolerance);
            try_get(t, "lean",          c.thresholds.lean);
            try_get(t, "head_drop",     c.thresholds.head_drop);
            try_get(t, "forward_dist",  c.thresholds.forward_dist);
            try_get(t, "backward_dist", c.thresholds.backward_dist);
        }
    } catch (const YAML::Exception& e) {
        std::cerr << "[PostureConfig] " << yaml_path << ": " << e.what() << ", keep defaults\n";
        return PostureConfig{};
    }
    return c;
}

PostureConfig PostureConfig::fromJson(const std::string& json_path) {
    PostureConfig c;
    try {
        std::ifstream ifs(json_path);
        if (!ifs) {
            std::cerr << "[PostureConfig] cannot open " << json_path << ", keep defaults\n";
            return c;
        }
        json r; ifs >> r;
        auto get_s = [&](const json& o, const char* k, std::string& v){ if(o.contains(k)) v = o[k].get<std::string>(); };
        auto get_i = [&](const json& o, const char* k, int& v){ if(o.contains(k)) v = o[k].get<int>(); };
        auto get_f = [&](const json& o, const char* k, float& v){ if(o.contains(k)) v = o[k].get<float>(); };
        auto get_d = [&](const json& o, const char* k, double& v){ if(o.contains(k)) v = o[k].get<double>(); };
        auto get_b = [&](const json& o, const char* k, bool& v){ if(o.contains(k)) v = o[k].get<bool>(); };

        get_s(r, "listen_host", c.listen_host);
        get_i(r, "listen_port", c.listen_port);
        get_s(r, "server_name", c.server_name);
        get_s(r, "db_path", c.db_path);

        get_s(r, "model_path", c.model_path);
        get_i(r, "input_w", c.input_w);
        get_i(r, "input_h", c.input_h);
        get_f(r, "conf_thres_person", c.conf_thres_person);
        get_f(r, "conf_thres_keypoint", c.conf_thres_keypoint);
        get_b(r, "fake_infer", c.fake_infer);
        get_i(r, "intra_threads", c.intra_threads);

        get_i(r, "min_frame_w", c.min_frame_w);
        get_i(r, "min_frame_h", c.min_frame_h);
        get_i(r, "stats_every_n_frames", c.stats_every_n_frames);
        get_i(r, "annotated_jpg_quality", c.annotated_jpg_quality);

        if (r.contains("thresholds")) {
            const json& t = r["thresholds"];
            get_d(t, "neck_angle", c.thresholds.neck_angle);
            get_d(t, "spine_tilt", c.thresholds.spine_tilt);
            get_d(t, "shoulder_tilt", c.thresholds.shoulder_tilt);
            get_d(t, "tolerance", c.thresholds.tolerance);
            get_d(t, "lean", c.thresholds.lean);
            get_i(t, "head_drop", c.thresholds.head_drop);
            get_d(t, "forward_dist", c.thresholds.forward_dist);
            get_d(t, "backward_dist", c.thresholds.backward_dist);
        }
    } catch (const json::exception& e) {
        std::cerr << "[PostureConfig] " << json_path << ": " << e.what() << ", keep defaults\n";
        return PostureConfig{};
    }
    return c;
}

} // namespace vision
