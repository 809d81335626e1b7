#include <cvpipe/extraction/document.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace cvpipe::extraction {

namespace {

std::string lowerExtension(const std::string& name) {
    auto ext = std::filesystem::path(name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

Document::Document(std::shared_ptr<const std::vector<std::byte>> bytes,
                   std::optional<std::filesystem::path> path, std::string name)
    : bytes_(std::move(bytes)), path_(std::move(path)), name_(std::move(name)) {
    kind_ = detectKind(*bytes_, name_);
}

Result<Document> Document::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Document not found: " + path.string()};
    }
    if (std::filesystem::is_directory(path, ec)) {
        return Error{ErrorCode::InvalidArgument, "Document path is a directory: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::PermissionDenied, "Failed to open document: " + path.string()};
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto bytes = std::make_shared<std::vector<std::byte>>(raw.size());
    if (!raw.empty()) {
        std::memcpy(bytes->data(), raw.data(), raw.size());
    }

    return Document(std::move(bytes), path, path.filename().string());
}

Document Document::fromBuffer(std::vector<std::byte> bytes, std::string name) {
    auto shared = std::make_shared<const std::vector<std::byte>>(std::move(bytes));
    return Document(std::move(shared), std::nullopt, std::move(name));
}

Document Document::fromString(std::string_view text, std::string name) {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return fromBuffer(std::move(bytes), std::move(name));
}

DocumentKind Document::detectKind(std::span<const std::byte> bytes, const std::string& name) {
    static constexpr char kPdfMagic[] = "%PDF-";
    constexpr size_t magicLen = sizeof(kPdfMagic) - 1;

    // Magic may be preceded by a few bytes of junk; PDF readers scan the first 1KB.
    size_t window = std::min<size_t>(bytes.size(), 1024);
    auto begin = reinterpret_cast<const char*>(bytes.data());
    if (window >= magicLen && std::search(begin, begin + window, kPdfMagic,
                                          kPdfMagic + magicLen) != begin + window) {
        return DocumentKind::Pdf;
    }
    return lowerExtension(name) == ".pdf" ? DocumentKind::Pdf : DocumentKind::PlainText;
}

} // namespace cvpipe::extraction
