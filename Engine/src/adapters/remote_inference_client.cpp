#include <adapters/remote_inference_client.hpp>
#include <core/errors.hpp>
#include <utils/base64.hpp>
#include <utils/logger.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace Stonetrail {

using json = nlohmann::json;

RemoteInferenceClient::RemoteInferenceClient(std::string base_url, std::chrono::seconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {}

std::string RemoteInferenceClient::post_json(const std::string& path, const std::string& body) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(timeout_);
    cli.set_read_timeout(timeout_);
    cli.set_write_timeout(timeout_);

    Timer timer;
    auto res = cli.Post(path, body, "application/json");
    if (!res) {
        throw CollaboratorUnavailable("inference", path + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw CollaboratorUnavailable("inference", path + " returned HTTP " + std::to_string(res->status));
    }
    Logger::debug(path + " answered in " + std::to_string(timer.elapsed_ms()) + " ms");
    return res->body;
}

Embedding RemoteInferenceClient::embed_image(const Bytes& image) {
    json req = {{"image_base64", base64_encode(image)}};
    return parse_embedding(post_json("/embed/image", req.dump()));
}

Embedding RemoteInferenceClient::embed_text(const std::string& text) {
    json req = {{"text", text}};
    return parse_embedding(post_json("/embed/text", req.dump()));
}

CropResult RemoteInferenceClient::crop_subject(const Bytes& image) {
    json req = {{"image_base64", base64_encode(image)}};
    return parse_crop(post_json("/crop", req.dump()));
}

Embedding RemoteInferenceClient::parse_embedding(const std::string& body) {
    try {
        json j = json::parse(body);
        const json& values = j.at("embedding");
        if (!values.is_array() || values.empty()) {
            throw CollaboratorUnavailable("inference", "embedding is missing or empty");
        }
        return values.get<Embedding>();
    } catch (const json::exception& e) {
        throw CollaboratorUnavailable("inference", std::string("malformed embedding response: ") + e.what());
    }
}

CropResult RemoteInferenceClient::parse_crop(const std::string& body) {
    try {
        json j = json::parse(body);

        CropResult result;
        result.found = j.value("found", false);
        if (j.contains("cropped_image") && j["cropped_image"].is_string()) {
            result.cropped = base64_decode(j["cropped_image"].get<std::string>());
        }
        if (j.contains("thumbnail") && j["thumbnail"].is_string()) {
            result.thumbnail = base64_decode(j["thumbnail"].get<std::string>());
        }
        if (result.cropped.empty()) result.found = false;
        return result;
    } catch (const json::exception& e) {
        throw CollaboratorUnavailable("inference", std::string("malformed crop response: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw CollaboratorUnavailable("inference", std::string("bad base64 in crop response: ") + e.what());
    }
}

} // namespace Stonetrail
