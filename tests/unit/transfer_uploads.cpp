#include <cassert>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "renderxfer/cancellation.hpp"
#include "renderxfer/transfer_error.hpp"
#include "renderxfer/uploader.hpp"
#include "test_support.hpp"

using namespace renderxfer;
using namespace renderxfer::test;

namespace
{

    const UploadPolicy kSmallPolicy{.threshold = 100, .part_size = 100};

    UploadSpec make_spec(const std::filesystem::path &path, std::uint64_t size)
    {
        return UploadSpec{
            .bucket = "renders",
            .key = "renders/job-1.mp4",
            .file_path = path,
            .file_size = size,
            .content_type = "video/mp4",
            .content_disposition = "attachment; filename=\"job.mp4\"",
        };
    }

    void test_single_upload_below_threshold()
    {
        const auto dir = fresh_dir("renderxfer_upload_single");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(99);
        write_file(source, data);

        FakeObjectStore store;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        const auto strategy = uploader.upload(make_spec(source, data.size()));
        assert(strategy == UploadStrategy::Single);
        assert(store.calls == std::vector<std::string>{"put_object"});
        assert(store.put_content_length == 99);
        assert(store.last_metadata.content_type == "video/mp4");
        assert(store.last_metadata.content_disposition == "attachment; filename=\"job.mp4\"");
        assert(store.objects.at("renders/renders/job-1.mp4") == data);
        assert(recorder.events.empty());

        cleanup_path(dir);
    }

    void test_single_upload_99_mib_with_default_policy()
    {
        const auto dir = fresh_dir("renderxfer_upload_99mib");
        const auto source = dir / "out.mp4";
        const std::uint64_t size = 99 * kMiB;
        make_sparse_file(source, size);

        FakeObjectStore store;
        store.keep_bytes = false;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink());

        assert(uploader.upload(make_spec(source, size)) == UploadStrategy::Single);
        assert(store.calls == std::vector<std::string>{"put_object"});
        assert(store.put_content_length == 99ULL * 1024 * 1024);
        assert(store.count("create_multipart_upload") == 0);

        cleanup_path(dir);
    }

    void test_zero_byte_file_is_single_put()
    {
        const auto dir = fresh_dir("renderxfer_upload_empty");
        const auto source = dir / "empty.mp4";
        write_file(source, "");

        FakeObjectStore store;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        assert(uploader.upload(make_spec(source, 0)) == UploadStrategy::Single);
        assert(store.calls == std::vector<std::string>{"put_object"});
        assert(store.put_content_length == 0);
        assert(store.objects.at("renders/renders/job-1.mp4").empty());

        cleanup_path(dir);
    }

    void test_exact_threshold_goes_multipart()
    {
        const auto dir = fresh_dir("renderxfer_upload_boundary");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(100);
        write_file(source, data);

        FakeObjectStore store;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        assert(uploader.upload(make_spec(source, data.size())) == UploadStrategy::Multipart);
        assert((store.calls == std::vector<std::string>{"create_multipart_upload", "upload_part",
                                                        "complete_multipart_upload"}));
        assert(store.part_sizes == std::vector<std::uint64_t>{100});
        assert(store.objects.at("renders/renders/job-1.mp4") == data);

        cleanup_path(dir);
    }

    void test_multipart_parts_and_events()
    {
        const auto dir = fresh_dir("renderxfer_upload_multipart");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(250);
        write_file(source, data);

        FakeObjectStore store;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        assert(uploader.upload(make_spec(source, data.size())) == UploadStrategy::Multipart);

        assert(store.count("create_multipart_upload") == 1);
        assert(store.count("upload_part") == 3);
        assert(store.count("complete_multipart_upload") == 1);
        assert(store.count("abort_multipart_upload") == 0);
        assert(store.calls.back() == "complete_multipart_upload");
        assert((store.part_numbers == std::vector<std::uint32_t>{1, 2, 3}));
        assert((store.part_sizes == std::vector<std::uint64_t>{100, 100, 50}));
        assert(store.max_part_bytes <= kSmallPolicy.part_size);
        assert(store.last_metadata.content_type == "video/mp4");

        assert(store.completed.size() == 3);
        for (std::size_t i = 0; i < store.completed.size(); ++i)
        {
            assert(store.completed[i].part_number == i + 1);
            assert(store.completed[i].etag == "\"etag-" + std::to_string(i + 1) + "\"");
        }
        assert(store.objects.at("renders/renders/job-1.mp4") == data);

        const auto start = recorder.named("multipart_start");
        assert(start.size() == 1);
        assert(start[0].at("fileSize") == 250);
        assert(start[0].at("partSize") == 100);
        assert(start[0].at("totalParts") == 3);

        const auto parts = recorder.named("multipart_part_uploaded");
        assert(parts.size() == 3);
        const std::vector<int> expected_pct{33, 67, 100};
        const std::vector<int> expected_sizes{100, 100, 50};
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            assert(parts[i].at("part") == i + 1);
            assert(parts[i].at("totalParts") == 3);
            assert(parts[i].at("partSize") == expected_sizes[i]);
            assert(parts[i].at("pct") == expected_pct[i]);
        }

        const auto complete = recorder.named("multipart_complete");
        assert(complete.size() == 1);
        assert(complete[0].at("parts") == 3);
        assert(recorder.named("multipart_abort").empty());

        cleanup_path(dir);
    }

    void test_multipart_250_mib_with_default_policy()
    {
        const auto dir = fresh_dir("renderxfer_upload_250mib");
        const auto source = dir / "out.mp4";
        const std::uint64_t size = 250 * kMiB;
        make_sparse_file(source, size);

        FakeObjectStore store;
        store.keep_bytes = false;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink());

        assert(uploader.upload(make_spec(source, size)) == UploadStrategy::Multipart);
        assert((store.part_sizes == std::vector<std::uint64_t>{100 * kMiB, 100 * kMiB, 50 * kMiB}));
        assert(store.max_part_bytes <= 100 * kMiB);

        const auto parts = recorder.named("multipart_part_uploaded");
        assert(parts.size() == 3);
        assert(parts[0].at("pct") == 33);
        assert(parts[1].at("pct") == 67);
        assert(parts[2].at("pct") == 100);

        cleanup_path(dir);
    }

    void test_peak_part_buffer_bounded_for_large_file()
    {
        const auto dir = fresh_dir("renderxfer_upload_1gib");
        const auto source = dir / "out.mp4";
        const std::uint64_t size = 1024 * kMiB;
        make_sparse_file(source, size);

        FakeObjectStore store;
        store.keep_bytes = false;
        EventRecorder recorder;
        const UploadPolicy policy{.threshold = 100 * kMiB, .part_size = 64 * kMiB};
        Uploader uploader(store, recorder.sink(), policy);

        uploader.upload(make_spec(source, size));
        assert(store.count("upload_part") == 16);
        assert(store.max_part_bytes == 64 * kMiB);

        cleanup_path(dir);
    }

    void test_part_failure_aborts_and_rethrows_original()
    {
        const auto dir = fresh_dir("renderxfer_upload_part_failure");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(250);
        write_file(source, data);

        for (std::uint32_t failing = 1; failing <= 3; ++failing)
        {
            FakeObjectStore store;
            store.fail_part = failing;
            EventRecorder recorder;
            Uploader uploader(store, recorder.sink(), kSmallPolicy);

            bool caught = false;
            try
            {
                uploader.upload(make_spec(source, data.size()));
            }
            catch (const TransferError &ex)
            {
                caught = true;
                assert(ex.code() == ErrorCode::RemoteStore);
                assert(std::string(ex.what()) == "injected failure on part " + std::to_string(failing));
            }
            assert(caught);
            assert(store.count("upload_part") == failing);
            assert(store.count("complete_multipart_upload") == 0);
            assert(store.aborted_ids == std::vector<std::string>{"upload-7f3a"});
            assert(store.calls.back() == "abort_multipart_upload");

            const auto aborts = recorder.named("multipart_abort");
            assert(aborts.size() == 1);
            assert(aborts[0].at("error") == "injected failure on part " + std::to_string(failing));
            assert(recorder.errors.empty());
        }

        cleanup_path(dir);
    }

    void test_abort_failure_does_not_mask_original_error()
    {
        const auto dir = fresh_dir("renderxfer_upload_abort_failure");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(250);
        write_file(source, data);

        FakeObjectStore store;
        store.fail_part = 2;
        store.fail_abort = true;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        bool caught = false;
        try
        {
            uploader.upload(make_spec(source, data.size()));
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(std::string(ex.what()) == "injected failure on part 2");
        }
        assert(caught);
        assert(store.count("abort_multipart_upload") == 1);
        assert(recorder.errors.size() == 1);
        assert(recorder.errors[0].first == "multipart_abort_failed");
        assert(recorder.errors[0].second == "injected abort failure");

        cleanup_path(dir);
    }

    void test_failing_event_sink_still_aborts()
    {
        const auto dir = fresh_dir("renderxfer_upload_sink_failure");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(250);
        write_file(source, data);

        for (const bool abort_fails : {false, true})
        {
            FakeObjectStore store;
            store.fail_part = 2;
            store.fail_abort = abort_fails;
            std::size_t error_calls = 0;
            const EventSink broken{
                .log = [](std::string_view step, const nlohmann::json &)
                {
                    if (step == "multipart_abort")
                    {
                        throw std::runtime_error("event sink down");
                    }
                },
                .log_error = [&error_calls](std::string_view, std::string_view)
                {
                    ++error_calls;
                    throw std::runtime_error("error sink down");
                },
            };
            Uploader uploader(store, broken, kSmallPolicy);

            bool caught = false;
            try
            {
                uploader.upload(make_spec(source, data.size()));
            }
            catch (const TransferError &ex)
            {
                caught = true;
                assert(ex.code() == ErrorCode::RemoteStore);
                assert(std::string(ex.what()) == "injected failure on part 2");
            }
            assert(caught);
            assert(store.aborted_ids == std::vector<std::string>{"upload-7f3a"});
            assert(error_calls == (abort_fails ? 1u : 0u));
        }

        cleanup_path(dir);
    }

    std::size_t open_descriptor_count()
    {
        std::size_t count = 0;
        for ([[maybe_unused]] const auto &entry : std::filesystem::directory_iterator("/proc/self/fd"))
        {
            ++count;
        }
        return count;
    }

    void test_source_handle_released_on_every_exit()
    {
        if (!std::filesystem::exists("/proc/self/fd"))
        {
            return;
        }
        const auto dir = fresh_dir("renderxfer_upload_handles");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(250);
        write_file(source, data);

        const auto run = [&](FakeObjectStore &store)
        {
            EventRecorder recorder;
            std::optional<std::size_t> during_loop;
            store.on_part_uploaded = [&](std::uint32_t)
            {
                if (!during_loop)
                {
                    during_loop = open_descriptor_count();
                }
            };
            Uploader uploader(store, recorder.sink(), kSmallPolicy);
            const auto before = open_descriptor_count();
            try
            {
                uploader.upload(make_spec(source, data.size()));
            }
            catch (const TransferError &)
            {
            }
            assert(open_descriptor_count() == before);
            // The source stays open while parts are sent.
            assert(during_loop && *during_loop == before + 1);
        };

        FakeObjectStore succeeding;
        run(succeeding);
        assert(succeeding.count("complete_multipart_upload") == 1);

        FakeObjectStore failing_part;
        failing_part.fail_part = 2;
        run(failing_part);
        assert(failing_part.count("abort_multipart_upload") == 1);

        FakeObjectStore failing_complete;
        failing_complete.fail_complete = true;
        run(failing_complete);
        assert(failing_complete.count("abort_multipart_upload") == 1);

        cleanup_path(dir);
    }

    void test_peak_part_buffer_bounded_for_ten_gib_file()
    {
        const auto dir = fresh_dir("renderxfer_upload_10gib");
        const auto source = dir / "out.mp4";
        const std::uint64_t size = 10 * 1024 * kMiB;
        make_sparse_file(source, size);

        FakeObjectStore store;
        store.keep_bytes = false;
        EventRecorder recorder;
        const UploadPolicy policy{.threshold = 100 * kMiB, .part_size = 512 * kMiB};
        Uploader uploader(store, recorder.sink(), policy);

        assert(uploader.upload(make_spec(source, size)) == UploadStrategy::Multipart);
        assert(store.count("upload_part") == 20);
        assert(store.max_part_bytes == 512 * kMiB);
        assert(recorder.named("multipart_complete").size() == 1);

        cleanup_path(dir);
    }

    void test_missing_upload_id_fails_before_parts()
    {
        const auto dir = fresh_dir("renderxfer_upload_no_id");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(250);
        write_file(source, data);

        FakeObjectStore store;
        store.upload_id.clear();
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        bool caught = false;
        try
        {
            uploader.upload(make_spec(source, data.size()));
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::MissingUploadId);
        }
        assert(caught);
        assert(store.calls == std::vector<std::string>{"create_multipart_upload"});
        assert(recorder.named("multipart_abort").empty());

        cleanup_path(dir);
    }

    void test_complete_failure_aborts()
    {
        const auto dir = fresh_dir("renderxfer_upload_complete_failure");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(250);
        write_file(source, data);

        FakeObjectStore store;
        store.fail_complete = true;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        bool caught = false;
        try
        {
            uploader.upload(make_spec(source, data.size()));
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(std::string(ex.what()) == "injected complete failure");
        }
        assert(caught);
        assert(store.count("upload_part") == 3);
        assert(store.aborted_ids == std::vector<std::string>{"upload-7f3a"});
        assert(recorder.named("multipart_complete").empty());

        cleanup_path(dir);
    }

    void test_short_source_aborts_session()
    {
        const auto dir = fresh_dir("renderxfer_upload_short");
        const auto source = dir / "out.mp4";
        write_file(source, pattern_bytes(180));

        FakeObjectStore store;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        bool caught = false;
        try
        {
            uploader.upload(make_spec(source, 250));
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::FileIo);
        }
        assert(caught);
        assert(store.count("upload_part") == 1);
        assert(store.count("abort_multipart_upload") == 1);

        cleanup_path(dir);
    }

    void test_missing_source_file()
    {
        const auto dir = fresh_dir("renderxfer_upload_missing");

        FakeObjectStore store;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        bool caught = false;
        try
        {
            uploader.upload(make_spec(dir / "absent.mp4", 10));
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::FileIo);
        }
        assert(caught);
        assert(store.calls.empty());

        caught = false;
        try
        {
            uploader.upload(make_spec(dir / "absent.mp4", 500));
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::FileIo);
        }
        assert(caught);
        assert(store.count("abort_multipart_upload") == 1);

        cleanup_path(dir);
    }

    void test_cancellation_mid_upload_aborts()
    {
        const auto dir = fresh_dir("renderxfer_upload_cancel");
        const auto source = dir / "out.mp4";
        const auto data = pattern_bytes(250);
        write_file(source, data);

        CancellationToken cancel;
        FakeObjectStore store;
        store.on_part_uploaded = [&cancel](std::uint32_t part)
        {
            if (part == 1)
            {
                cancel.cancel();
            }
        };
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), kSmallPolicy);

        bool caught = false;
        try
        {
            uploader.upload(make_spec(source, data.size()), &cancel);
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::Cancelled);
        }
        assert(caught);
        assert(store.count("upload_part") == 1);
        assert(store.count("complete_multipart_upload") == 0);
        assert(store.aborted_ids == std::vector<std::string>{"upload-7f3a"});

        cleanup_path(dir);
    }

    void test_part_limit_rejected_before_session()
    {
        const auto dir = fresh_dir("renderxfer_upload_part_limit");
        const auto source = dir / "out.mp4";
        write_file(source, pattern_bytes(10001));

        FakeObjectStore store;
        EventRecorder recorder;
        Uploader uploader(store, recorder.sink(), UploadPolicy{.threshold = 1, .part_size = 1});

        bool caught = false;
        try
        {
            uploader.upload(make_spec(source, 10001));
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::PartLimitExceeded);
        }
        assert(caught);
        assert(store.calls.empty());

        cleanup_path(dir);
    }

    void test_invalid_policy_and_target()
    {
        FakeObjectStore store;
        EventRecorder recorder;

        bool caught = false;
        try
        {
            Uploader uploader(store, recorder.sink(), UploadPolicy{.threshold = 100, .part_size = 0});
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::InvalidArgument);
        }
        assert(caught);

        Uploader uploader(store, recorder.sink(), kSmallPolicy);
        auto spec = make_spec("unused.mp4", 10);
        spec.key.clear();
        caught = false;
        try
        {
            uploader.upload(spec);
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::InvalidArgument);
        }
        assert(caught);
        assert(store.calls.empty());
    }

} // namespace

void run_upload_tests()
{
    test_single_upload_below_threshold();
    test_single_upload_99_mib_with_default_policy();
    test_zero_byte_file_is_single_put();
    test_exact_threshold_goes_multipart();
    test_multipart_parts_and_events();
    test_multipart_250_mib_with_default_policy();
    test_peak_part_buffer_bounded_for_large_file();
    test_peak_part_buffer_bounded_for_ten_gib_file();
    test_part_failure_aborts_and_rethrows_original();
    test_abort_failure_does_not_mask_original_error();
    test_failing_event_sink_still_aborts();
    test_source_handle_released_on_every_exit();
    test_missing_upload_id_fails_before_parts();
    test_complete_failure_aborts();
    test_short_source_aborts_session();
    test_missing_source_file();
    test_cancellation_mid_upload_aborts();
    test_part_limit_rejected_before_session();
    test_invalid_policy_and_target();
}
