/**
 * @file context.hpp
 * @brief Scoped tags and correlation frames attached to packets.
 * @author log_courier contributors
 *
 * Each logical flow owns an ExecutionContext holding two stacks: tag frames
 * (key→value) and correlation frames (correlation id, operation name,
 * depth). The context is bound to the running thread; capture_context() and
 * ContextBinding carry it to another thread, e.g. into a worker task.
 *
 * Scopes pop their own frame by id, so exiting scopes out of order never
 * removes someone else's frame.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/types.hpp"

namespace log_courier {

/// Tag keys with special meaning: they override the correlation frame.
inline constexpr std::string_view kTraceIdKey = "_traceId";
inline constexpr std::string_view kSpanNameKey = "_spanName";

/**
 * @brief Everything a packet needs from the context, frozen at creation.
 */
struct ContextSnapshot {
    ContextMap tags;
    std::string correlation_id;
    std::string operation_name;
    int32_t operation_depth = 0;

    bool operator==(const ContextSnapshot&) const = default;
};

struct CorrelationFrame {
    std::string correlation_id;
    std::string operation_name;
    int32_t depth = 0;
};

// ─────────────────────────────────────────────
// ExecutionContext
// ─────────────────────────────────────────────

class ExecutionContext {
public:
    using FrameId = uint64_t;

    ExecutionContext() = default;

    /// Deep copy; the copy evolves independently from the source.
    [[nodiscard]] std::shared_ptr<ExecutionContext> clone() const;

    FrameId push_tags(ContextMap tags);
    void pop_tags(FrameId id);

    FrameId push_correlation(CorrelationFrame frame);
    void pop_correlation(FrameId id);

    /// Tags folded outer→inner, then @p inline_tags on top.
    [[nodiscard]] ContextMap merged_tags(const ContextMap& inline_tags = {}) const;

    [[nodiscard]] std::optional<CorrelationFrame> correlation() const;

    /**
     * @brief Merge tags and resolve the correlation for one packet.
     *
     * `_traceId` and `_spanName` in the merged tags replace the correlation
     * id and operation name of the innermost correlation frame.
     */
    [[nodiscard]] ContextSnapshot snapshot(const ContextMap& inline_tags = {}) const;

    [[nodiscard]] size_t tag_depth() const;
    [[nodiscard]] size_t correlation_depth() const;

    /// Context bound to the calling thread; created on first use.
    [[nodiscard]] static std::shared_ptr<ExecutionContext> current();

private:
    mutable std::mutex mutex_;
    FrameId next_id_{1};
    std::vector<std::pair<FrameId, ContextMap>> tag_frames_;
    std::vector<std::pair<FrameId, CorrelationFrame>> correlation_frames_;
};

/**
 * @brief Binds a context to the current thread for the lifetime of the
 * object, restoring the previous binding afterwards.
 */
class ContextBinding {
public:
    explicit ContextBinding(std::shared_ptr<ExecutionContext> context);
    ~ContextBinding();

    ContextBinding(const ContextBinding&) = delete;
    ContextBinding& operator=(const ContextBinding&) = delete;

private:
    std::shared_ptr<ExecutionContext> previous_;
};

/// Independent copy of the calling thread's context, for handing to another thread.
[[nodiscard]] std::shared_ptr<ExecutionContext> capture_context();

// ─────────────────────────────────────────────
// RAII scopes
// ─────────────────────────────────────────────

class TagScope {
public:
    explicit TagScope(ContextMap tags);
    TagScope(std::shared_ptr<ExecutionContext> context, ContextMap tags);
    ~TagScope();

    TagScope(TagScope&& other) noexcept;
    TagScope(const TagScope&) = delete;
    TagScope& operator=(const TagScope&) = delete;
    TagScope& operator=(TagScope&&) = delete;

private:
    std::shared_ptr<ExecutionContext> context_;
    ExecutionContext::FrameId id_{0};
};

class CorrelationScope {
public:
    explicit CorrelationScope(CorrelationFrame frame);
    CorrelationScope(std::shared_ptr<ExecutionContext> context, CorrelationFrame frame);
    ~CorrelationScope();

    CorrelationScope(CorrelationScope&& other) noexcept;
    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;
    CorrelationScope& operator=(CorrelationScope&&) = delete;

    [[nodiscard]] const std::string& correlation_id() const noexcept { return correlation_id_; }

private:
    std::shared_ptr<ExecutionContext> context_;
    ExecutionContext::FrameId id_{0};
    std::string correlation_id_;
};

/// Start a new correlation (fresh random id, depth 0) on the current context.
[[nodiscard]] CorrelationScope begin_correlation(std::string operation_name = {});

/// Nest an operation one level deeper under the current correlation.
[[nodiscard]] CorrelationScope begin_operation(std::string operation_name);

/// 128-bit random id as 32 lowercase hex characters.
[[nodiscard]] std::string generate_correlation_id();

// ─────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────

struct ContextKey {
    std::string_view name;

    [[nodiscard]] std::pair<std::string, std::string> set(std::string value) const {
        return {std::string{name}, std::move(value)};
    }
};

namespace keys {
inline constexpr ContextKey RequestId{"requestId"};
inline constexpr ContextKey UserId{"userId"};
inline constexpr ContextKey TraceId{kTraceIdKey};
inline constexpr ContextKey SpanName{kSpanNameKey};
}  // namespace keys

/**
 * @brief Fluent construction of a tag scope.
 *
 *   auto scope = ContextBuilder{}.with("tenant", "acme")
 *                                .with(keys::RequestId, id)
 *                                .enter();
 */
class ContextBuilder {
public:
    ContextBuilder& with(std::string key, std::string value);
    ContextBuilder& with(ContextKey key, std::string value);

    [[nodiscard]] const ContextMap& build() const noexcept { return tags_; }
    [[nodiscard]] TagScope enter() const;

private:
    ContextMap tags_;
};

}  // namespace log_courier
