#include "renderxfer/uploader.hpp"

#include <exception>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "renderxfer/cancellation.hpp"
#include "renderxfer/transfer_error.hpp"

namespace renderxfer
{

    namespace
    {

        void check_cancel(const CancellationToken *cancel)
        {
            if (cancel)
            {
                cancel->throw_if_cancelled();
            }
        }

    } // namespace

    Uploader::Uploader(ObjectStore &store, EventSink events, UploadPolicy policy)
        : store_(store),
          events_(std::move(events)),
          policy_(policy)
    {
        validate(policy_);
    }

    UploadStrategy Uploader::upload(const UploadSpec &spec, const CancellationToken *cancel)
    {
        if (spec.bucket.empty() || spec.key.empty())
        {
            throw TransferError(ErrorCode::InvalidArgument, "Upload requires a bucket and a key");
        }
        check_cancel(cancel);

        const ObjectRef target{.bucket = spec.bucket, .key = spec.key};
        const ObjectMetadata metadata{
            .content_type = spec.content_type,
            .content_disposition = spec.content_disposition,
        };

        const auto strategy = select_strategy(spec.file_size, policy_);
        if (strategy == UploadStrategy::Single)
        {
            upload_single(spec, target, metadata);
        }
        else
        {
            upload_multipart(spec, target, metadata, cancel);
        }
        return strategy;
    }

    void Uploader::upload_single(const UploadSpec &spec, const ObjectRef &target, const ObjectMetadata &metadata)
    {
        auto body = std::make_shared<std::fstream>(spec.file_path, std::ios::in | std::ios::binary);
        if (!body->is_open())
        {
            throw TransferError(ErrorCode::FileIo, "Could not open upload source: " + spec.file_path.string());
        }
        store_.put_object(target, std::move(body), spec.file_size, metadata);
    }

    void Uploader::upload_multipart(const UploadSpec &spec, const ObjectRef &target, const ObjectMetadata &metadata,
                                    const CancellationToken *cancel)
    {
        const PartPlan plan(spec.file_size, policy_.part_size);
        if (plan.total_parts() > kMaxMultipartParts)
        {
            throw TransferError(ErrorCode::PartLimitExceeded,
                                "File needs " + std::to_string(plan.total_parts()) + " parts, the store accepts at most " +
                                    std::to_string(kMaxMultipartParts));
        }

        events_.emit("multipart_start", {{"fileSize", plan.file_size()},
                                         {"partSize", plan.part_size()},
                                         {"totalParts", plan.total_parts()}});

        const auto upload_id = store_.create_multipart_upload(target, metadata);
        if (upload_id.empty())
        {
            throw TransferError(ErrorCode::MissingUploadId, "CreateMultipartUpload returned no UploadId");
        }

        try
        {
            send_parts(spec, plan, target, upload_id, cancel);
        }
        catch (const std::exception &ex)
        {
            abort_session(target, upload_id, ex.what());
            throw;
        }
        catch (...)
        {
            abort_session(target, upload_id, "unknown error");
            throw;
        }
    }

    void Uploader::send_parts(const UploadSpec &spec, const PartPlan &plan, const ObjectRef &target,
                              const std::string &upload_id, const CancellationToken *cancel)
    {
        std::ifstream in(spec.file_path, std::ios::binary);
        if (!in.is_open())
        {
            throw TransferError(ErrorCode::FileIo, "Could not open upload source: " + spec.file_path.string());
        }

        std::vector<CompletedPart> completed;
        completed.reserve(static_cast<std::size_t>(plan.total_parts()));

        for (std::uint64_t number = 1; number <= plan.total_parts(); ++number)
        {
            check_cancel(cancel);
            const auto range = plan.part(number);

            std::vector<std::byte> buffer(static_cast<std::size_t>(range.length));
            in.seekg(static_cast<std::streamoff>(range.offset));
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            if (static_cast<std::uint64_t>(in.gcount()) != range.length)
            {
                throw TransferError(ErrorCode::FileIo, "Short read of part " + std::to_string(number) + " from " +
                                                           spec.file_path.string());
            }

            auto etag = store_.upload_part(target, upload_id, range.part_number, buffer);
            completed.push_back(CompletedPart{.part_number = range.part_number, .etag = std::move(etag)});

            events_.emit("multipart_part_uploaded", {{"part", number},
                                                     {"totalParts", plan.total_parts()},
                                                     {"partSize", range.length},
                                                     {"pct", progress_percent(number, plan.total_parts())}});
        }

        check_cancel(cancel);
        store_.complete_multipart_upload(target, upload_id, completed);
        events_.emit("multipart_complete", {{"parts", completed.size()}});
    }

    void Uploader::abort_session(const ObjectRef &target, const std::string &upload_id,
                                 const std::string &reason) noexcept
    {
        // Each step is guarded on its own: a failing sink must not skip the abort.
        try
        {
            events_.emit("multipart_abort", {{"error", reason}});
        }
        catch (...)
        {
        }

        std::string failure;
        try
        {
            store_.abort_multipart_upload(target, upload_id);
            return;
        }
        catch (const std::exception &ex)
        {
            failure = ex.what();
        }
        catch (...)
        {
            failure = "unknown error";
        }

        try
        {
            events_.emit_error("multipart_abort_failed", failure);
        }
        catch (...)
        {
        }
    }

} // namespace renderxfer
