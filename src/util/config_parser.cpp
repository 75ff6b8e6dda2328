#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace curator::config {

void CuratorConfigFromFile::Reset() {
    *this = CuratorConfigFromFile{};
}

Result CuratorConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(-1, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

Result CuratorConfigFromFile::LoadString(const std::string& json_text) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(json_text, json, err)) {
        return Result::Fail(-1, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(-1, "Config: " + err);
    }

    return Result::Ok();
}

} // namespace curator::config
