#include "openai_vector_store.hpp"

#include "errors.hpp"

#include <nlohmann/json.hpp>

namespace canvas::server {

OpenAiVectorStore::OpenAiVectorStore(std::string api_base, std::string api_key, const HttpClient& http)
    : api_base_(std::move(api_base)), api_key_(std::move(api_key)), http_(http) {
    while (!api_base_.empty() && api_base_.back() == '/') {
        api_base_.pop_back();
    }
}

std::vector<std::string> OpenAiVectorStore::headers(bool json_body) const {
    std::vector<std::string> list{"Authorization: Bearer " + api_key_, "OpenAI-Beta: assistants=v2"};
    if (json_body) {
        list.emplace_back("Content-Type: application/json");
    }
    return list;
}

std::string OpenAiVectorStore::require_id(const HttpResponse& response, const std::string& what) const {
    if (!response.ok()) {
        throw ExternalUploadError(what + " returned HTTP " + std::to_string(response.status) + ": " +
                                  response.body.substr(0, 200));
    }
    const auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("id") || !body["id"].is_string()) {
        throw ExternalUploadError(what + " returned no id");
    }
    return body["id"].get<std::string>();
}

std::string OpenAiVectorStore::create_store(const std::string& name) {
    const nlohmann::json request{{"name", name}};
    return require_id(http_.post(api_base_ + "/vector_stores", headers(true), request.dump()), "Vector store creation");
}

std::string OpenAiVectorStore::upload(const std::string& vector_store_id, const std::filesystem::path& file) {
    const auto file_id = require_id(
        http_.post_multipart(api_base_ + "/files", headers(false),
                             {MultipartField{"purpose", "assistants", {}}, MultipartField{"file", {}, file}}),
        "File upload of " + file.filename().string());

    const nlohmann::json attach{{"file_id", file_id}};
    require_id(http_.post(api_base_ + "/vector_stores/" + vector_store_id + "/files", headers(true), attach.dump()),
               "Attaching " + file.filename().string());
    return file_id;
}

}  // namespace canvas::server
