/**
 * renderxfer - Size-dependent single or multipart upload of a local file.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "renderxfer/event_sink.hpp"
#include "renderxfer/object_store.hpp"
#include "renderxfer/part_plan.hpp"

namespace renderxfer
{

    class CancellationToken;

    struct UploadSpec
    {
        std::string bucket;
        std::string key;
        std::filesystem::path file_path;
        // Must equal the size of file_path; drives strategy selection.
        std::uint64_t file_size{};
        std::string content_type;
        std::string content_disposition;
    };

    class Uploader
    {
    public:
        Uploader(ObjectStore &store, EventSink events, UploadPolicy policy = {});

        const UploadPolicy &policy() const noexcept { return policy_; }

        /**
         * Uploads spec.file_path to spec.bucket/spec.key and returns the strategy used.
         *
         * Any failure after a multipart session was created aborts that session before
         * the original exception is rethrown. Peak buffer memory is one part.
         */
        UploadStrategy upload(const UploadSpec &spec, const CancellationToken *cancel = nullptr);

    private:
        void upload_single(const UploadSpec &spec, const ObjectRef &target, const ObjectMetadata &metadata);
        void upload_multipart(const UploadSpec &spec, const ObjectRef &target, const ObjectMetadata &metadata,
                              const CancellationToken *cancel);
        void send_parts(const UploadSpec &spec, const PartPlan &plan, const ObjectRef &target,
                        const std::string &upload_id, const CancellationToken *cancel);
        void abort_session(const ObjectRef &target, const std::string &upload_id, const std::string &reason) noexcept;

        ObjectStore &store_;
        EventSink events_;
        UploadPolicy policy_;
    };

} // namespace renderxfer
