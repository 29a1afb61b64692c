/**
 * renderxfer - ObjectStore backed by the AWS SDK for C++ S3 client.
 *
 * Works against any S3-compatible endpoint (AWS, Cloudflare R2, MinIO).
 */
#pragma once

#include <memory>
#include <string>

#include "renderxfer/object_store.hpp"

namespace Aws
{
    struct SDKOptions;
}

namespace renderxfer::backends
{

    // Aws::InitAPI / Aws::ShutdownAPI for the lifetime of the process.
    class AwsApiGuard
    {
    public:
        AwsApiGuard();
        ~AwsApiGuard();

        AwsApiGuard(const AwsApiGuard &) = delete;
        AwsApiGuard &operator=(const AwsApiGuard &) = delete;

    private:
        std::unique_ptr<Aws::SDKOptions> options_;
    };

    struct S3Settings
    {
        std::string endpoint;
        std::string region{"auto"};
        std::string access_key_id;
        std::string secret_access_key;
        bool verify_tls{true};
    };

    class S3ObjectStore : public ObjectStore
    {
    public:
        explicit S3ObjectStore(const S3Settings &settings);
        ~S3ObjectStore() override;

        S3ObjectStore(const S3ObjectStore &) = delete;
        S3ObjectStore &operator=(const S3ObjectStore &) = delete;

        void put_object(const ObjectRef &target, std::shared_ptr<std::iostream> body, std::uint64_t content_length,
                        const ObjectMetadata &metadata) override;

        std::string create_multipart_upload(const ObjectRef &target, const ObjectMetadata &metadata) override;

        std::string upload_part(const ObjectRef &target, const std::string &upload_id, std::uint32_t part_number,
                                std::span<const std::byte> data) override;

        void complete_multipart_upload(const ObjectRef &target, const std::string &upload_id,
                                       const std::vector<CompletedPart> &parts) override;

        void abort_multipart_upload(const ObjectRef &target, const std::string &upload_id) override;

        void get_object(const ObjectRef &source, std::ostream &sink) override;

        bool object_exists(const ObjectRef &target) override;

        std::string presign_get(const ObjectRef &target, std::chrono::seconds expiry) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace renderxfer::backends
