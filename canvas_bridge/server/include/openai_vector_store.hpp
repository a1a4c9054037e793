#pragma once

#include "collaborators.hpp"
#include "http_client.hpp"

#include <string>
#include <vector>

namespace canvas::server {

// OpenAI vector store API (assistants v2). Errors are thrown as
// ExternalUploadError.
class OpenAiVectorStore : public VectorStoreProvider {
public:
    OpenAiVectorStore(std::string api_base, std::string api_key, const HttpClient& http);

    std::string create_store(const std::string& name) override;
    std::string upload(const std::string& vector_store_id, const std::filesystem::path& file) override;

private:
    std::vector<std::string> headers(bool json_body) const;
    std::string require_id(const HttpResponse& response, const std::string& what) const;

    std::string api_base_;
    std::string api_key_;
    const HttpClient& http_;
};

}  // namespace canvas::server
