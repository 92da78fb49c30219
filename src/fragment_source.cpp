#include "streamrpc/fragment_source.hpp"

namespace streamrpc {

// ---------- VectorSource ----------

VectorSource::VectorSource(std::vector<nlohmann::json> fragments)
    : fragments_(std::move(fragments)) {
}

std::optional<nlohmann::json> VectorSource::next() {
    if (cancelled_ || index_ >= fragments_.size()) return std::nullopt;
    return fragments_[index_++];
}

void VectorSource::cancel() {
    cancelled_ = true;
}

// ---------- GeneratorSource ----------

GeneratorSource::GeneratorSource(Generator gen)
    : gen_(std::move(gen)) {
}

std::optional<nlohmann::json> GeneratorSource::next() {
    if (exhausted_ || cancelled_) return std::nullopt;
    auto fragment = gen_();
    if (!fragment) exhausted_ = true;
    return fragment;
}

void GeneratorSource::cancel() {
    cancelled_ = true;
}

// ---------- FragmentChannel ----------

bool FragmentChannel::push(nlohmann::json fragment) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || closed_) return false;
        queue_.push_back(std::move(fragment));
    }
    cv_.notify_one();
    return true;
}

void FragmentChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void FragmentChannel::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        error_ = std::move(error);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<nlohmann::json> FragmentChannel::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_ || cancelled_; });
    if (cancelled_) return std::nullopt;
    if (!queue_.empty()) {
        nlohmann::json fragment = std::move(queue_.front());
        queue_.pop_front();
        return fragment;
    }
    // Fragments pushed before a failure are delivered first.
    if (error_) std::rethrow_exception(error_);
    return std::nullopt;
}

void FragmentChannel::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

} // namespace streamrpc
