#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace haptick {
namespace audio {

/**
 * Scoped FFTW single-precision real-to-complex transform of a fixed size.
 *
 * The plan and its aligned input/output buffers are acquired in the
 * constructor and released in the destructor. Planning goes through a
 * process-wide lock because the FFTW planner is not thread-safe; execute()
 * on distinct plans may run concurrently.
 */
class FftPlan {
public:
    explicit FftPlan(size_t size);
    ~FftPlan();

    FftPlan(const FftPlan&) = delete;
    FftPlan& operator=(const FftPlan&) = delete;
    FftPlan(FftPlan&&) noexcept;
    FftPlan& operator=(FftPlan&&) noexcept;

    size_t size() const { return size_; }
    size_t binCount() const { return size_ / 2; }

    /**
     * Transform `frame` (size() samples) and write |X[k]|^2 for
     * k in [0, size()/2) into `power`.
     */
    void powerSpectrum(const std::vector<float>& frame, std::vector<float>& power);

private:
    struct Impl;

    size_t size_;
    std::unique_ptr<Impl> impl_;
};

} // namespace audio
} // namespace haptick
