#include "renderxfer/part_plan.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "renderxfer/transfer_error.hpp"

namespace renderxfer
{

    void validate(const UploadPolicy &policy)
    {
        if (policy.threshold == 0)
        {
            throw TransferError(ErrorCode::InvalidArgument, "Upload threshold must be greater than zero");
        }
        if (policy.part_size == 0)
        {
            throw TransferError(ErrorCode::InvalidArgument, "Multipart part size must be greater than zero");
        }
    }

    std::string_view to_string(UploadStrategy strategy) noexcept
    {
        switch (strategy)
        {
        case UploadStrategy::Single:
            return "single";
        case UploadStrategy::Multipart:
            return "multipart";
        }
        return "unknown";
    }

    UploadStrategy select_strategy(std::uint64_t file_size, const UploadPolicy &policy) noexcept
    {
        return file_size < policy.threshold ? UploadStrategy::Single : UploadStrategy::Multipart;
    }

    PartPlan::PartPlan(std::uint64_t file_size, std::uint64_t part_size)
        : file_size_(file_size),
          part_size_(part_size),
          total_parts_(0)
    {
        if (part_size_ == 0)
        {
            throw TransferError(ErrorCode::InvalidArgument, "Multipart part size must be greater than zero");
        }
        total_parts_ = file_size_ / part_size_ + (file_size_ % part_size_ == 0 ? 0 : 1);
    }

    PartRange PartPlan::part(std::uint64_t part_number) const
    {
        if (part_number == 0 || part_number > total_parts_)
        {
            throw TransferError(ErrorCode::InvalidArgument,
                                "Part number " + std::to_string(part_number) + " outside [1, " +
                                    std::to_string(total_parts_) + "]");
        }
        const auto start = (part_number - 1) * part_size_;
        const auto end = std::min(part_number * part_size_, file_size_);
        return PartRange{
            .part_number = static_cast<std::uint32_t>(part_number),
            .offset = start,
            .length = end - start,
        };
    }

    int progress_percent(std::uint64_t part_number, std::uint64_t total_parts) noexcept
    {
        if (total_parts == 0)
        {
            return 100;
        }
        return static_cast<int>(std::lround(static_cast<double>(part_number) / static_cast<double>(total_parts) * 100.0));
    }

} // namespace renderxfer
