#ifndef AIRLINK_RESOURCE_IO_HPP
#define AIRLINK_RESOURCE_IO_HPP

#include "Transfer.hpp"
#include <memory>
#include <string>
#include <fstream>
#include <cstdint>

namespace airlink {

    /** Sequential reader over a local resource. Failures throw IoError. */
    class ChunkSource {
    public:
        virtual ~ChunkSource() = default;

        /** Reads up to maxBytes; returns 0 only at end of resource. */
        virtual size_t read(uint8_t* buffer, size_t maxBytes) = 0;
        virtual uint64_t totalSize() const = 0;
    };

    /** Sequential writer into a local resource. Failures throw IoError. */
    class ChunkSink {
    public:
        virtual ~ChunkSink() = default;

        virtual void write(const uint8_t* data, size_t length) = 0;
        /** Makes the written data visible under its final name. */
        virtual void commit() = 0;
        /** Drops partially written data. Never throws. */
        virtual void discard() = 0;
    };

    class ResourceProvider {
    public:
        virtual ~ResourceProvider() = default;

        /**
         * Checks the resource is usable for the given direction and fills in what the
         * provider knows (size, final path). Returns false with a readable reason otherwise.
         */
        virtual bool resolve(ResourceDescriptor& descriptor, TransferDirection direction, std::string& error) = 0;

        virtual std::unique_ptr<ChunkSource> openSource(const ResourceDescriptor& descriptor) = 0;
        virtual std::unique_ptr<ChunkSink> openSink(const ResourceDescriptor& descriptor) = 0;

        /** Looks up a resource offered to remote peers by name. */
        virtual bool lookupShared(const std::string& name, ResourceDescriptor& out) = 0;
    };

    /**
     * Filesystem provider. Outbound resources are read from their path (or from the
     * shared directory by name); inbound resources land in the download directory.
     */
    class FileResourceProvider : public ResourceProvider {
    public:
        explicit FileResourceProvider(std::string downloadDirectory, std::string sharedDirectory = "");

        bool resolve(ResourceDescriptor& descriptor, TransferDirection direction, std::string& error) override;
        std::unique_ptr<ChunkSource> openSource(const ResourceDescriptor& descriptor) override;
        std::unique_ptr<ChunkSink> openSink(const ResourceDescriptor& descriptor) override;
        bool lookupShared(const std::string& name, ResourceDescriptor& out) override;

        const std::string& downloadDirectory() const { return downloadDir; }
        const std::string& sharedDirectory() const { return sharedDir; }

        /** Strips any directory part so remote names cannot escape a directory. */
        static std::string sanitizeName(const std::string& name);

    private:
        std::string downloadDir;
        std::string sharedDir;
    };

} // namespace airlink

#endif // AIRLINK_RESOURCE_IO_HPP
