/**
 * renderxfer - Object store seam used by the uploader and the store downloader.
 *
 * Implementations report failures by throwing TransferError.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace renderxfer
{

    struct ObjectRef
    {
        std::string bucket;
        std::string key;
    };

    // Forwarded verbatim to the store.
    struct ObjectMetadata
    {
        std::string content_type;
        std::string content_disposition;
    };

    struct CompletedPart
    {
        std::uint32_t part_number{};
        std::string etag;
    };

    class ObjectStore
    {
    public:
        virtual ~ObjectStore() = default;

        virtual void put_object(const ObjectRef &target, std::shared_ptr<std::iostream> body,
                                std::uint64_t content_length, const ObjectMetadata &metadata) = 0;

        // Returns the upload id issued by the store, which may be empty.
        virtual std::string create_multipart_upload(const ObjectRef &target, const ObjectMetadata &metadata) = 0;

        // Returns the part's ETag.
        virtual std::string upload_part(const ObjectRef &target, const std::string &upload_id,
                                        std::uint32_t part_number, std::span<const std::byte> data) = 0;

        // parts must be in ascending part_number order.
        virtual void complete_multipart_upload(const ObjectRef &target, const std::string &upload_id,
                                               const std::vector<CompletedPart> &parts) = 0;

        virtual void abort_multipart_upload(const ObjectRef &target, const std::string &upload_id) = 0;

        // Streams the object body into sink.
        virtual void get_object(const ObjectRef &source, std::ostream &sink) = 0;

        virtual bool object_exists(const ObjectRef &target) = 0;

        virtual std::string presign_get(const ObjectRef &target, std::chrono::seconds expiry) = 0;
    };

} // namespace renderxfer
