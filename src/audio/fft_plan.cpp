#include "audio/fft_plan.hpp"
#include <fftw3.h>
#include <algorithm>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>

namespace haptick {
namespace audio {

namespace {

std::mutex& plannerMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

struct FftPlan::Impl {
    float* input = nullptr;
    fftwf_complex* output = nullptr;
    fftwf_plan plan = nullptr;

    ~Impl() {
        std::lock_guard<std::mutex> lock(plannerMutex());
        if (plan != nullptr) {
            fftwf_destroy_plan(plan);
        }
        if (output != nullptr) {
            fftwf_free(output);
        }
        if (input != nullptr) {
            fftwf_free(input);
        }
    }
};

FftPlan::FftPlan(size_t size)
    : size_(size), impl_(std::make_unique<Impl>()) {
    if (size_ < 2) {
        throw std::invalid_argument("FFT size must be at least 2, got " + std::to_string(size_));
    }

    std::lock_guard<std::mutex> lock(plannerMutex());

    impl_->input = static_cast<float*>(fftwf_malloc(sizeof(float) * size_));
    impl_->output = static_cast<fftwf_complex*>(fftwf_malloc(sizeof(fftwf_complex) * (size_ / 2 + 1)));
    if (impl_->input == nullptr || impl_->output == nullptr) {
        throw std::bad_alloc();
    }

    impl_->plan = fftwf_plan_dft_r2c_1d(static_cast<int>(size_), impl_->input, impl_->output, FFTW_ESTIMATE);
    if (impl_->plan == nullptr) {
        throw std::runtime_error("Failed to create FFT plan of size " + std::to_string(size_));
    }
}

FftPlan::~FftPlan() = default;

FftPlan::FftPlan(FftPlan&&) noexcept = default;

FftPlan& FftPlan::operator=(FftPlan&&) noexcept = default;

void FftPlan::powerSpectrum(const std::vector<float>& frame, std::vector<float>& power) {
    if (frame.size() != size_) {
        throw std::invalid_argument("Frame has " + std::to_string(frame.size()) +
                                    " samples, plan expects " + std::to_string(size_));
    }

    std::copy(frame.begin(), frame.end(), impl_->input);
    fftwf_execute(impl_->plan);

    const size_t bins = binCount();
    power.resize(bins);
    for (size_t k = 0; k < bins; ++k) {
        const float re = impl_->output[k][0];
        const float im = impl_->output[k][1];
        power[k] = re * re + im * im;
    }
}

} // namespace audio
} // namespace haptick
