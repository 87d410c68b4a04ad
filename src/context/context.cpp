/**
 * @file context.cpp
 * @brief ExecutionContext, scopes and thread binding.
 * @author log_courier contributors
 */

#include "context/context.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace log_courier {

namespace {

thread_local std::shared_ptr<ExecutionContext> t_bound_context;

template <typename Frames>
void erase_frame(Frames& frames, ExecutionContext::FrameId id) {
    auto it = std::find_if(frames.begin(), frames.end(),
                           [id](const auto& f) { return f.first == id; });
    if (it != frames.end()) frames.erase(it);
}

}  // namespace

// ─────────────────────────────────────────────
// ExecutionContext
// ─────────────────────────────────────────────

std::shared_ptr<ExecutionContext> ExecutionContext::clone() const {
    auto copy = std::make_shared<ExecutionContext>();
    std::lock_guard lock(mutex_);
    copy->next_id_ = next_id_;
    copy->tag_frames_ = tag_frames_;
    copy->correlation_frames_ = correlation_frames_;
    return copy;
}

ExecutionContext::FrameId ExecutionContext::push_tags(ContextMap tags) {
    std::lock_guard lock(mutex_);
    const FrameId id = next_id_++;
    tag_frames_.emplace_back(id, std::move(tags));
    return id;
}

void ExecutionContext::pop_tags(FrameId id) {
    std::lock_guard lock(mutex_);
    erase_frame(tag_frames_, id);
}

ExecutionContext::FrameId ExecutionContext::push_correlation(CorrelationFrame frame) {
    std::lock_guard lock(mutex_);
    const FrameId id = next_id_++;
    correlation_frames_.emplace_back(id, std::move(frame));
    return id;
}

void ExecutionContext::pop_correlation(FrameId id) {
    std::lock_guard lock(mutex_);
    erase_frame(correlation_frames_, id);
}

ContextMap ExecutionContext::merged_tags(const ContextMap& inline_tags) const {
    ContextMap merged;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, frame] : tag_frames_) {
            for (const auto& [key, value] : frame) {
                merged[key] = value;
            }
        }
    }
    for (const auto& [key, value] : inline_tags) {
        merged[key] = value;
    }
    return merged;
}

std::optional<CorrelationFrame> ExecutionContext::correlation() const {
    std::lock_guard lock(mutex_);
    if (correlation_frames_.empty()) return std::nullopt;
    return correlation_frames_.back().second;
}

ContextSnapshot ExecutionContext::snapshot(const ContextMap& inline_tags) const {
    ContextSnapshot snap;
    snap.tags = merged_tags(inline_tags);

    if (auto frame = correlation()) {
        snap.correlation_id = frame->correlation_id;
        snap.operation_name = frame->operation_name;
        snap.operation_depth = frame->depth;
    }
    if (auto it = snap.tags.find(std::string{kTraceIdKey}); it != snap.tags.end()) {
        snap.correlation_id = it->second;
    }
    if (auto it = snap.tags.find(std::string{kSpanNameKey}); it != snap.tags.end()) {
        snap.operation_name = it->second;
    }
    return snap;
}

size_t ExecutionContext::tag_depth() const {
    std::lock_guard lock(mutex_);
    return tag_frames_.size();
}

size_t ExecutionContext::correlation_depth() const {
    std::lock_guard lock(mutex_);
    return correlation_frames_.size();
}

std::shared_ptr<ExecutionContext> ExecutionContext::current() {
    if (!t_bound_context) {
        t_bound_context = std::make_shared<ExecutionContext>();
    }
    return t_bound_context;
}

// ─────────────────────────────────────────────
// Binding
// ─────────────────────────────────────────────

ContextBinding::ContextBinding(std::shared_ptr<ExecutionContext> context)
    : previous_(std::move(t_bound_context)) {
    t_bound_context = context ? std::move(context) : std::make_shared<ExecutionContext>();
}

ContextBinding::~ContextBinding() {
    t_bound_context = std::move(previous_);
}

std::shared_ptr<ExecutionContext> capture_context() {
    return ExecutionContext::current()->clone();
}

// ─────────────────────────────────────────────
// Scopes
// ─────────────────────────────────────────────

TagScope::TagScope(ContextMap tags)
    : TagScope(ExecutionContext::current(), std::move(tags)) {}

TagScope::TagScope(std::shared_ptr<ExecutionContext> context, ContextMap tags)
    : context_(std::move(context)) {
    id_ = context_->push_tags(std::move(tags));
}

TagScope::TagScope(TagScope&& other) noexcept
    : context_(std::move(other.context_)), id_(std::exchange(other.id_, 0)) {}

TagScope::~TagScope() {
    if (context_) context_->pop_tags(id_);
}

CorrelationScope::CorrelationScope(CorrelationFrame frame)
    : CorrelationScope(ExecutionContext::current(), std::move(frame)) {}

CorrelationScope::CorrelationScope(std::shared_ptr<ExecutionContext> context, CorrelationFrame frame)
    : context_(std::move(context)), correlation_id_(frame.correlation_id) {
    id_ = context_->push_correlation(std::move(frame));
}

CorrelationScope::CorrelationScope(CorrelationScope&& other) noexcept
    : context_(std::move(other.context_))
    , id_(std::exchange(other.id_, 0))
    , correlation_id_(std::move(other.correlation_id_)) {}

CorrelationScope::~CorrelationScope() {
    if (context_) context_->pop_correlation(id_);
}

std::string generate_correlation_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << rng()
        << std::setw(16) << rng();
    return oss.str();
}

CorrelationScope begin_correlation(std::string operation_name) {
    return CorrelationScope{CorrelationFrame{generate_correlation_id(), std::move(operation_name), 0}};
}

CorrelationScope begin_operation(std::string operation_name) {
    auto context = ExecutionContext::current();
    CorrelationFrame frame;
    if (auto outer = context->correlation()) {
        frame.correlation_id = outer->correlation_id;
        frame.depth = outer->depth + 1;
    } else {
        frame.depth = 1;
    }
    frame.operation_name = std::move(operation_name);
    return CorrelationScope{std::move(context), std::move(frame)};
}

// ─────────────────────────────────────────────
// ContextBuilder
// ─────────────────────────────────────────────

ContextBuilder& ContextBuilder::with(std::string key, std::string value) {
    tags_[std::move(key)] = std::move(value);
    return *this;
}

ContextBuilder& ContextBuilder::with(ContextKey key, std::string value) {
    tags_[std::string{key.name}] = std::move(value);
    return *this;
}

TagScope ContextBuilder::enter() const {
    return TagScope{tags_};
}

}  // namespace log_courier
