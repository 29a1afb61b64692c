/**
 * renderxfer - Upload strategy selection and multipart byte-range planning.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace renderxfer
{

    constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

    // Hard per-upload part count limit of S3-compatible stores.
    constexpr std::uint64_t kMaxMultipartParts = 10000;

    struct UploadPolicy
    {
        std::uint64_t threshold{100 * kMiB};
        std::uint64_t part_size{100 * kMiB};
    };

    // Throws TransferError(ErrorCode::InvalidArgument) for a zero threshold or part size.
    void validate(const UploadPolicy &policy);

    enum class UploadStrategy : std::uint8_t
    {
        Single,
        Multipart
    };

    std::string_view to_string(UploadStrategy strategy) noexcept;

    // Single when file_size < threshold, Multipart otherwise.
    UploadStrategy select_strategy(std::uint64_t file_size, const UploadPolicy &policy) noexcept;

    struct PartRange
    {
        std::uint32_t part_number{}; // 1-based
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    class PartPlan
    {
    public:
        PartPlan(std::uint64_t file_size, std::uint64_t part_size);

        std::uint64_t file_size() const noexcept { return file_size_; }
        std::uint64_t part_size() const noexcept { return part_size_; }
        std::uint64_t total_parts() const noexcept { return total_parts_; }

        // part_number in [1, total_parts()]; the last part is the only one shorter than part_size().
        PartRange part(std::uint64_t part_number) const;

    private:
        std::uint64_t file_size_;
        std::uint64_t part_size_;
        std::uint64_t total_parts_;
    };

    // round(part_number / total_parts * 100)
    int progress_percent(std::uint64_t part_number, std::uint64_t total_parts) noexcept;

} // namespace renderxfer
