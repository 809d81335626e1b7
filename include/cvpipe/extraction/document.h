#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <cvpipe/core/types.h>

namespace cvpipe::extraction {

enum class DocumentKind { Pdf, PlainText };

/**
 * @brief Immutable handle to an input document's bytes
 *
 * Copies share the underlying buffer.
 */
class Document {
public:
    /**
     * @brief Read a document from disk
     * @return FileNotFound if the path does not exist, InvalidArgument for directories
     */
    static Result<Document> open(const std::filesystem::path& path);

    /**
     * @brief Wrap an in-memory buffer
     * @param name Used for kind detection (extension) and log messages
     */
    static Document fromBuffer(std::vector<std::byte> bytes, std::string name = "buffer");

    static Document fromString(std::string_view text, std::string name = "buffer.txt");

    [[nodiscard]] const std::optional<std::filesystem::path>& path() const { return path_; }
    [[nodiscard]] std::span<const std::byte> bytes() const { return {*bytes_}; }
    [[nodiscard]] const char* data() const {
        return reinterpret_cast<const char*>(bytes_->data());
    }
    [[nodiscard]] size_t byteSize() const { return bytes_->size(); }
    [[nodiscard]] bool empty() const { return bytes_->empty(); }
    [[nodiscard]] DocumentKind kind() const { return kind_; }
    [[nodiscard]] const std::string& displayName() const { return name_; }

private:
    Document(std::shared_ptr<const std::vector<std::byte>> bytes,
             std::optional<std::filesystem::path> path, std::string name);

    static DocumentKind detectKind(std::span<const std::byte> bytes, const std::string& name);

    std::shared_ptr<const std::vector<std::byte>> bytes_;
    std::optional<std::filesystem::path> path_;
    std::string name_;
    DocumentKind kind_ = DocumentKind::PlainText;
};

} // namespace cvpipe::extraction
