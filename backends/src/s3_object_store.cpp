#include "renderxfer/backends/s3_object_store.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <utility>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3ClientConfiguration.h>
#include <aws/s3/S3EndpointProvider.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include "renderxfer/transfer_error.hpp"

namespace renderxfer::backends
{

    namespace
    {

        constexpr const char *kAllocTag = "renderxfer";

        template <typename Error>
        [[noreturn]] void throw_store_error(const char *operation, const ObjectRef &ref, const Error &error)
        {
            const auto code = error.GetErrorType() == Aws::S3::S3Errors::NETWORK_CONNECTION ? ErrorCode::Network
                                                                                            : ErrorCode::RemoteStore;
            throw TransferError(code, std::string(operation) + " " + ref.bucket + "/" + ref.key + " failed: " +
                                          error.GetExceptionName() + ": " + error.GetMessage());
        }

        template <typename Request>
        Request make_request(const ObjectRef &ref)
        {
            return Request{}.WithBucket(ref.bucket).WithKey(ref.key);
        }

        template <typename Request>
        Request make_session_request(const ObjectRef &ref, const std::string &upload_id)
        {
            return make_request<Request>(ref).WithUploadId(upload_id);
        }

        template <typename Request>
        void apply_metadata(Request &request, const ObjectMetadata &metadata)
        {
            if (!metadata.content_type.empty())
            {
                request.SetContentType(metadata.content_type);
            }
            if (!metadata.content_disposition.empty())
            {
                request.SetContentDisposition(metadata.content_disposition);
            }
        }

    } // namespace

    AwsApiGuard::AwsApiGuard()
        : options_(std::make_unique<Aws::SDKOptions>())
    {
        Aws::InitAPI(*options_);
    }

    AwsApiGuard::~AwsApiGuard()
    {
        Aws::ShutdownAPI(*options_);
    }

    class S3ObjectStore::Impl
    {
    public:
        explicit Impl(const S3Settings &settings)
        {
            Aws::S3::S3ClientConfiguration config;
            config.region = settings.region;
            if (!settings.endpoint.empty())
            {
                config.endpointOverride = settings.endpoint;
            }
            config.verifySSL = settings.verify_tls;
            config.useVirtualAddressing = false;
            config.payloadSigningPolicy = Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never;

            const Aws::Auth::AWSCredentials credentials(settings.access_key_id, settings.secret_access_key);
            client = Aws::MakeUnique<Aws::S3::S3Client>(kAllocTag, credentials,
                                                        Aws::MakeShared<Aws::S3::S3EndpointProvider>(kAllocTag),
                                                        config);
        }

        Aws::UniquePtr<Aws::S3::S3Client> client;
    };

    S3ObjectStore::S3ObjectStore(const S3Settings &settings)
        : impl_(std::make_unique<Impl>(settings))
    {
    }

    S3ObjectStore::~S3ObjectStore() = default;

    void S3ObjectStore::put_object(const ObjectRef &target, std::shared_ptr<std::iostream> body,
                                   std::uint64_t content_length, const ObjectMetadata &metadata)
    {
        auto request = make_request<Aws::S3::Model::PutObjectRequest>(target);
        apply_metadata(request, metadata);
        request.SetContentLength(static_cast<long long>(content_length));
        request.SetBody(std::move(body));

        const auto outcome = impl_->client->PutObject(request);
        if (!outcome.IsSuccess())
        {
            throw_store_error("PutObject", target, outcome.GetError());
        }
    }

    std::string S3ObjectStore::create_multipart_upload(const ObjectRef &target, const ObjectMetadata &metadata)
    {
        auto request = make_request<Aws::S3::Model::CreateMultipartUploadRequest>(target);
        apply_metadata(request, metadata);

        const auto outcome = impl_->client->CreateMultipartUpload(request);
        if (!outcome.IsSuccess())
        {
            throw_store_error("CreateMultipartUpload", target, outcome.GetError());
        }
        return outcome.GetResult().GetUploadId();
    }

    std::string S3ObjectStore::upload_part(const ObjectRef &target, const std::string &upload_id,
                                           std::uint32_t part_number, std::span<const std::byte> data)
    {
        auto request = make_session_request<Aws::S3::Model::UploadPartRequest>(target, upload_id);
        request.SetPartNumber(static_cast<int>(part_number));
        request.SetContentLength(static_cast<long long>(data.size()));

        // The SDK only reads from the body; the buffer stays owned by the caller.
        Aws::Utils::Stream::PreallocatedStreamBuf buffer(
            const_cast<unsigned char *>(reinterpret_cast<const unsigned char *>(data.data())), data.size());
        request.SetBody(Aws::MakeShared<Aws::IOStream>(kAllocTag, &buffer));

        const auto outcome = impl_->client->UploadPart(request);
        if (!outcome.IsSuccess())
        {
            throw_store_error("UploadPart", target, outcome.GetError());
        }
        return outcome.GetResult().GetETag();
    }

    void S3ObjectStore::complete_multipart_upload(const ObjectRef &target, const std::string &upload_id,
                                                  const std::vector<CompletedPart> &parts)
    {
        Aws::S3::Model::CompletedMultipartUpload body;
        for (const auto &part : parts)
        {
            body.AddParts(Aws::S3::Model::CompletedPart{}
                              .WithPartNumber(static_cast<int>(part.part_number))
                              .WithETag(part.etag));
        }

        auto request = make_session_request<Aws::S3::Model::CompleteMultipartUploadRequest>(target, upload_id);
        request.SetMultipartUpload(std::move(body));

        const auto outcome = impl_->client->CompleteMultipartUpload(request);
        if (!outcome.IsSuccess())
        {
            throw_store_error("CompleteMultipartUpload", target, outcome.GetError());
        }
    }

    void S3ObjectStore::abort_multipart_upload(const ObjectRef &target, const std::string &upload_id)
    {
        const auto outcome = impl_->client->AbortMultipartUpload(
            make_session_request<Aws::S3::Model::AbortMultipartUploadRequest>(target, upload_id));
        if (!outcome.IsSuccess())
        {
            throw_store_error("AbortMultipartUpload", target, outcome.GetError());
        }
    }

    void S3ObjectStore::get_object(const ObjectRef &source, std::ostream &sink)
    {
        auto request = make_request<Aws::S3::Model::GetObjectRequest>(source);
        // Stream straight into the caller's sink instead of the SDK's in-memory default.
        request.SetResponseStreamFactory([&sink]()
                                         { return Aws::New<Aws::IOStream>(kAllocTag, sink.rdbuf()); });

        const auto outcome = impl_->client->GetObject(request);
        if (!outcome.IsSuccess())
        {
            throw_store_error("GetObject", source, outcome.GetError());
        }
        if (outcome.GetResult().GetBody().bad())
        {
            throw TransferError(ErrorCode::FileIo, "Failed to write " + source.bucket + "/" + source.key +
                                                       " to the local sink");
        }
    }

    bool S3ObjectStore::object_exists(const ObjectRef &target)
    {
        const auto outcome = impl_->client->HeadObject(make_request<Aws::S3::Model::HeadObjectRequest>(target));
        if (outcome.IsSuccess())
        {
            return true;
        }
        if (outcome.GetError().GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND)
        {
            return false;
        }
        throw_store_error("HeadObject", target, outcome.GetError());
    }

    std::string S3ObjectStore::presign_get(const ObjectRef &target, std::chrono::seconds expiry)
    {
        auto url = impl_->client->GeneratePresignedUrl(target.bucket, target.key, Aws::Http::HttpMethod::HTTP_GET,
                                                       static_cast<std::uint64_t>(expiry.count()));
        if (url.empty())
        {
            throw TransferError(ErrorCode::RemoteStore, "Could not presign " + target.bucket + "/" + target.key);
        }
        return url;
    }

} // namespace renderxfer::backends
