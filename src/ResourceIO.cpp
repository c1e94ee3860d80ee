#include "airlink/ResourceIO.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace airlink {

    namespace {

        class FileChunkSource : public ChunkSource {
        public:
            FileChunkSource(const std::string& path, uint64_t size)
                : file(path, std::ios::binary), filePath(path), size(size) {
                if (!file.is_open()) {
                    throw IoError("Cannot open " + path + " for reading");
                }
            }

            size_t read(uint8_t* buffer, size_t maxBytes) override {
                if (maxBytes == 0 || file.eof()) {
                    return 0;
                }

                file.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(maxBytes));
                if (file.bad()) {
                    throw IoError("Read error on " + filePath);
                }
                return static_cast<size_t>(file.gcount());
            }

            uint64_t totalSize() const override {
                return size;
            }

        private:
            std::ifstream file;
            std::string filePath;
            uint64_t size;
        };

        class FileChunkSink : public ChunkSink {
        public:
            explicit FileChunkSink(const std::string& path)
                : finalPath(path), partPath(path + ".part") {
                file.open(partPath, std::ios::binary | std::ios::trunc);
                if (!file.is_open()) {
                    throw IoError("Cannot open " + partPath + " for writing");
                }
            }

            ~FileChunkSink() override {
                if (!committed) {
                    discard();
                }
            }

            void write(const uint8_t* data, size_t length) override {
                file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
                if (!file.good()) {
                    throw IoError("Write error on " + partPath);
                }
            }

            void commit() override {
                file.flush();
                file.close();
                if (file.fail()) {
                    throw IoError("Failed to flush " + partPath);
                }

                std::error_code ec;
                fs::rename(partPath, finalPath, ec);
                if (ec) {
                    throw IoError("Failed to move " + partPath + " into place: " + ec.message());
                }
                committed = true;
            }

            void discard() override {
                if (committed) {
                    return;
                }
                if (file.is_open()) {
                    file.close();
                }
                std::error_code ec;
                fs::remove(partPath, ec);
            }

        private:
            std::ofstream file;
            std::string finalPath;
            std::string partPath;
            bool committed = false;
        };

    } // namespace

    FileResourceProvider::FileResourceProvider(std::string downloadDirectory, std::string sharedDirectory)
        : downloadDir(std::move(downloadDirectory)),
          sharedDir(std::move(sharedDirectory)) {}

    std::string FileResourceProvider::sanitizeName(const std::string& name) {
        std::string base = fs::path(name).filename().string();
        if (base == "." || base == "..") {
            return "";
        }
        return base;
    }

    bool FileResourceProvider::resolve(ResourceDescriptor& descriptor, TransferDirection direction, std::string& error) {
        try {
            if (direction == TransferDirection::OUTBOUND) {
                if (descriptor.path.empty() && !sharedDir.empty()) {
                    descriptor.path = (fs::path(sharedDir) / sanitizeName(descriptor.name)).string();
                }

                const fs::path path(descriptor.path);
                if (descriptor.path.empty() || !fs::is_regular_file(path)) {
                    error = "File does not exist: " + descriptor.path;
                    return false;
                }

                const uint64_t actualSize = fs::file_size(path);
                if (descriptor.totalSizeBytes == 0) {
                    descriptor.totalSizeBytes = actualSize;
                } else if (descriptor.totalSizeBytes != actualSize) {
                    error = "Size mismatch for " + descriptor.path;
                    return false;
                }

                if (descriptor.name.empty()) {
                    descriptor.name = path.filename().string();
                }
            } else {
                const std::string name = sanitizeName(descriptor.name);
                if (name.empty()) {
                    error = "Invalid resource name: " + descriptor.name;
                    return false;
                }
                if (!fs::is_directory(downloadDir)) {
                    error = "Download directory does not exist: " + downloadDir;
                    return false;
                }
                descriptor.name = name;
                descriptor.path = (fs::path(downloadDir) / name).string();
            }
        } catch (const fs::filesystem_error& e) {
            error = std::string("File access error: ") + e.what();
            return false;
        }

        if (descriptor.totalSizeBytes == 0) {
            error = "Resource is empty: " + descriptor.name;
            return false;
        }
        return true;
    }

    std::unique_ptr<ChunkSource> FileResourceProvider::openSource(const ResourceDescriptor& descriptor) {
        return std::make_unique<FileChunkSource>(descriptor.path, descriptor.totalSizeBytes);
    }

    std::unique_ptr<ChunkSink> FileResourceProvider::openSink(const ResourceDescriptor& descriptor) {
        std::string path = descriptor.path;
        if (path.empty()) {
            path = (fs::path(downloadDir) / sanitizeName(descriptor.name)).string();
        }
        return std::make_unique<FileChunkSink>(path);
    }

    bool FileResourceProvider::lookupShared(const std::string& name, ResourceDescriptor& out) {
        const std::string base = sanitizeName(name);
        if (sharedDir.empty() || base.empty()) {
            return false;
        }

        std::error_code ec;
        const fs::path path = fs::path(sharedDir) / base;
        if (!fs::is_regular_file(path, ec)) {
            return false;
        }

        const uint64_t size = fs::file_size(path, ec);
        if (ec || size == 0) {
            return false;
        }

        out.name = base;
        out.path = path.string();
        out.totalSizeBytes = size;
        return true;
    }

} // namespace airlink
