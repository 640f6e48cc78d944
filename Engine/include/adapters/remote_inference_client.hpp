/**
 * @file remote_inference_client.hpp
 * @brief HTTP client for a remote crop + embedding inference endpoint
 */

#pragma once

#include <ports/collaborators.hpp>
#include <chrono>
#include <string>

namespace Stonetrail {

/**
 * @brief Remote inference service client
 *
 * Wire format (JSON over HTTP POST):
 *   /crop        {"image_base64"} -> {"found", "cropped_image", "thumbnail"}  (base64)
 *   /embed/image {"image_base64"} -> {"embedding": [float...]}
 *   /embed/text  {"text"}         -> {"embedding": [float...]}
 *
 * Transport errors, non-200 statuses and malformed bodies throw
 * CollaboratorUnavailable.
 */
class RemoteInferenceClient final : public EmbeddingService, public SubjectCropper {
public:
    explicit RemoteInferenceClient(std::string base_url,
                                   std::chrono::seconds timeout = std::chrono::seconds(60));

    Embedding embed_image(const Bytes& image) override;
    Embedding embed_text(const std::string& text) override;
    CropResult crop_subject(const Bytes& image) override;

    // Response parsers, exposed for tests
    static Embedding parse_embedding(const std::string& body);
    static CropResult parse_crop(const std::string& body);

private:
    std::string post_json(const std::string& path, const std::string& body);

    std::string base_url_;
    std::chrono::seconds timeout_;
};

} // namespace Stonetrail
