/**
 * @file session.cpp
 * @brief Session implementation.
 * @author log_courier contributors
 */

#include "client/session.hpp"

#include "context/context.hpp"

#include <cstdio>
#include <iterator>
#include <sys/syscall.h>
#include <typeinfo>
#include <unistd.h>

namespace log_courier {

namespace {

// Text viewers expect UTF-8 with a byte order mark.
constexpr uint8_t kUtf8Bom[] = {0xEF, 0xBB, 0xBF};

std::vector<uint8_t> text_payload(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(sizeof(kUtf8Bom) + text.size());
    out.insert(out.end(), std::begin(kUtf8Bom), std::end(kUtf8Bom));
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

int32_t current_process_id() {
    return static_cast<int32_t>(::getpid());
}

int32_t current_thread_id() {
    return static_cast<int32_t>(::syscall(SYS_gettid));
}

}  // namespace

std::string format_double(double value) {
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return "nan";
    return std::string(buf, end);
}

// ─────────────────────────────────────────────
// MetricBuilder / MethodScope
// ─────────────────────────────────────────────

MetricBuilder::MetricBuilder(Session& session, std::string name)
    : session_(session), name_(std::move(name)) {}

MetricBuilder& MetricBuilder::with_label(std::string key, std::string value) {
    labels_[std::move(key)] = std::move(value);
    return *this;
}

MetricBuilder& MetricBuilder::for_instance(std::string instance) {
    return with_label("instance", std::move(instance));
}

MetricBuilder& MetricBuilder::with_level(Level level) {
    level_ = level;
    return *this;
}

void MetricBuilder::send(WatchValue value) {
    session_.send_labeled_watch(name_, std::move(value), labels_, level_);
}

MethodScope::MethodScope(Session& session, Level level, std::string name)
    : session_(&session), level_(level), name_(std::move(name)) {
    session_->enter_method(level_, name_);
}

MethodScope::MethodScope(MethodScope&& other) noexcept
    : session_(other.session_), level_(other.level_), name_(std::move(other.name_)) {
    other.session_ = nullptr;
}

MethodScope::~MethodScope() {
    if (session_) session_->leave_method(level_, name_);
}

// ─────────────────────────────────────────────
// Settings
// ─────────────────────────────────────────────

Session::Session(PacketSink& sink, std::string name)
    : sink_(sink), name_(std::move(name)) {}

bool Session::active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

void Session::set_active(bool active) {
    std::lock_guard lock(mutex_);
    active_ = active;
}

Level Session::level() const {
    std::lock_guard lock(mutex_);
    return level_;
}

void Session::set_level(Level level) {
    std::lock_guard lock(mutex_);
    level_ = level;
}

Color Session::color() const {
    std::lock_guard lock(mutex_);
    return color_;
}

void Session::set_color(Color color) {
    std::lock_guard lock(mutex_);
    color_ = color;
}

void Session::reset_color() {
    set_color(kDefaultColor);
}

FilterState Session::filter_state() const {
    FilterState state;
    state.client_enabled = sink_.enabled();
    state.client_level = sink_.level();
    std::lock_guard lock(mutex_);
    state.session_active = active_;
    state.session_level = level_;
    return state;
}

bool Session::is_on(Level level) const {
    return is_admitted(filter_state(), level);
}

bool Session::is_on() const {
    return sink_.enabled() && active();
}

// ─────────────────────────────────────────────
// Packet construction
// ─────────────────────────────────────────────

void Session::send_log_entry(Level level, std::string_view title, LogEntryType type,
                             ViewerId viewer, std::vector<uint8_t> data,
                             std::optional<Color> color, const ContextMap& inline_context) {
    if (!is_on(level)) return;

    ContextSnapshot snapshot = ExecutionContext::current()->snapshot(inline_context);

    LogEntry entry;
    entry.entry_type = type;
    entry.viewer_id = viewer;
    entry.app_name = sink_.app_name();
    entry.session_name = name_;
    entry.title = std::string(title);
    entry.host_name = sink_.host_name();
    entry.correlation_id = std::move(snapshot.correlation_id);
    entry.operation_name = std::move(snapshot.operation_name);
    entry.operation_depth = snapshot.operation_depth;
    entry.context = std::move(snapshot.tags);
    entry.data = std::move(data);
    entry.process_id = current_process_id();
    entry.thread_id = current_thread_id();
    entry.timestamp = now_timestamp();
    entry.color = color ? *color : this->color();

    sink_.submit(Packet{level, std::move(entry)});
}

void Session::send_watch(Level level, std::string_view name, WatchValue value,
                         std::string_view group, ContextMap labels) {
    if (!is_on(level)) return;

    Watch watch;
    watch.name = std::string(name);
    watch.value = std::move(value.text);
    watch.watch_type = value.type;
    watch.timestamp = now_timestamp();
    watch.group = std::string(group);
    watch.labels = std::move(labels);
    sink_.submit(Packet{level, std::move(watch)});
}

void Session::send_labeled_watch(std::string_view name, WatchValue value, ContextMap labels,
                                 std::optional<Level> level) {
    send_watch(level ? *level : sink_.default_level(), name, std::move(value), {},
               std::move(labels));
}

void Session::send_process_flow(Level level, std::string_view title, ProcessFlowType type) {
    if (!is_on(level)) return;

    ProcessFlow flow;
    flow.flow_type = type;
    flow.title = std::string(title);
    flow.host_name = sink_.host_name();
    if (auto frame = ExecutionContext::current()->correlation()) {
        flow.correlation_id = std::move(frame->correlation_id);
    }
    flow.process_id = current_process_id();
    flow.thread_id = current_thread_id();
    flow.timestamp = now_timestamp();
    sink_.submit(Packet{level, std::move(flow)});
}

void Session::send_control_command(ControlCommandType type) {
    if (!is_on(Level::Control)) return;
    sink_.submit(Packet{Level::Control, ControlCommand{type, {}}});
}

// ─────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────

void Session::log_debug(std::string_view title)   { log(Level::Debug, title); }
void Session::log_verbose(std::string_view title) { log(Level::Verbose, title); }
void Session::log_message(std::string_view title) { log(Level::Message, title); }
void Session::log_warning(std::string_view title) { log(Level::Warning, title); }
void Session::log_error(std::string_view title)   { log(Level::Error, title); }
void Session::log_fatal(std::string_view title)   { log(Level::Fatal, title); }

void Session::log(Level level, std::string_view title) {
    LogEntryType type = LogEntryType::Message;
    switch (level) {
        case Level::Debug:   type = LogEntryType::Debug; break;
        case Level::Verbose: type = LogEntryType::Verbose; break;
        case Level::Warning: type = LogEntryType::Warning; break;
        case Level::Error:   type = LogEntryType::Error; break;
        case Level::Fatal:   type = LogEntryType::Fatal; break;
        default: break;
    }
    send_log_entry(level, title, type, ViewerId::Title);
}

void Session::log(Level level, const MessageBuilder& message) {
    log(level, std::string_view(message.str()));
}

void Session::log_with_context(Level level, std::string_view title, const ContextMap& context) {
    if (!is_on(level)) return;
    send_log_entry(level, title, LogEntryType::Message, ViewerId::Title, {}, std::nullopt, context);
}

void Session::log_separator() {
    log_separator(sink_.default_level());
}

void Session::log_separator(Level level) {
    send_log_entry(level, {}, LogEntryType::Separator, ViewerId::Title);
}

void Session::log_colored(Color color, std::string_view title) {
    log_colored(sink_.default_level(), color, title);
}

void Session::log_colored(Level level, Color color, std::string_view title) {
    send_log_entry(level, title, LogEntryType::Message, ViewerId::Title, {}, color);
}

void Session::log_exception(const std::exception& error, std::string_view title) {
    if (!is_on(Level::Error)) return;

    const std::string what = error.what();
    std::string caption = !title.empty() ? std::string(title) : (!what.empty() ? what : "Error");
    std::string details = std::string(typeid(error).name()) + ": " + what;
    send_log_entry(Level::Error, caption, LogEntryType::Error, ViewerId::Data,
                   text_payload(details));
}

void Session::log_internal_error(std::string_view title) {
    send_log_entry(Level::Error, title, LogEntryType::InternalError, ViewerId::Title);
}

void Session::log_assert(bool condition, std::string_view title) {
    if (condition) return;
    send_log_entry(Level::Error, title, LogEntryType::Assert, ViewerId::Title);
}

void Session::log_conditional(bool condition, std::string_view title) {
    log_conditional(sink_.default_level(), condition, title);
}

void Session::log_conditional(Level level, bool condition, std::string_view title) {
    if (!condition) return;
    send_log_entry(level, title, LogEntryType::Conditional, ViewerId::Title);
}

// ─────────────────────────────────────────────
// Payload entries
// ─────────────────────────────────────────────

void Session::log_text(std::string_view title, std::string_view text) {
    log_text(sink_.default_level(), title, text);
}

void Session::log_text(Level level, std::string_view title, std::string_view text) {
    if (!is_on(level)) return;
    send_log_entry(level, title, LogEntryType::Text, ViewerId::Data, text_payload(text));
}

void Session::log_source(std::string_view title, std::string_view source, SourceId id) {
    log_source(sink_.default_level(), title, source, id);
}

void Session::log_source(Level level, std::string_view title, std::string_view source,
                         SourceId id) {
    if (!is_on(level)) return;
    send_log_entry(level, title, LogEntryType::Source,
                   static_cast<ViewerId>(static_cast<int32_t>(id)), text_payload(source));
}

void Session::log_binary(std::string_view title, const std::vector<uint8_t>& data) {
    log_binary(sink_.default_level(), title, data);
}

void Session::log_binary(Level level, std::string_view title, const std::vector<uint8_t>& data) {
    if (!is_on(level)) return;
    send_log_entry(level, title, LogEntryType::Binary, ViewerId::Binary, data);
}

void Session::log_stream(std::string_view channel, std::string_view data,
                         std::string_view stream_type, std::string_view group) {
    log_stream(sink_.default_level(), channel, data, stream_type, group);
}

void Session::log_stream(Level level, std::string_view channel, std::string_view data,
                         std::string_view stream_type, std::string_view group) {
    if (!is_on(level)) return;

    StreamPacket stream;
    stream.channel = std::string(channel);
    stream.data = std::string(data);
    stream.stream_type = std::string(stream_type);
    stream.timestamp = now_timestamp();
    stream.group = std::string(group);
    sink_.submit(Packet{level, std::move(stream)});
}

// ─────────────────────────────────────────────
// Watches
// ─────────────────────────────────────────────

void Session::watch_string(std::string_view name, std::string_view value, std::string_view group) {
    send_watch(sink_.default_level(), name, {std::string(value), WatchType::String}, group);
}

void Session::watch_int(std::string_view name, int64_t value, std::string_view group,
                        bool include_hex) {
    const Level level = sink_.default_level();
    if (!is_on(level)) return;

    std::string text = std::to_string(value);
    if (include_hex) {
        char hex[32];
        std::snprintf(hex, sizeof(hex), " (0x%08llx)",
                      static_cast<unsigned long long>(static_cast<uint64_t>(value)));
        text += hex;
    }
    send_watch(level, name, {std::move(text), WatchType::Integer}, group);
}

void Session::watch_float(std::string_view name, double value, std::string_view group) {
    send_watch(sink_.default_level(), name, make_watch_value(value), group);
}

void Session::watch_bool(std::string_view name, bool value, std::string_view group) {
    send_watch(sink_.default_level(), name, make_watch_value(value), group);
}

void Session::watch(Level level, std::string_view name, WatchValue value, std::string_view group) {
    send_watch(level, name, std::move(value), group);
}

MetricBuilder Session::metric(std::string name) {
    return MetricBuilder(*this, std::move(name));
}

// ─────────────────────────────────────────────
// Counters / checkpoints / timers
// ─────────────────────────────────────────────

void Session::step_counter(Level level, std::string_view name, int64_t delta) {
    if (!is_on(level)) return;

    int64_t value = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = counters_.find(name);
        if (it == counters_.end()) it = counters_.emplace(std::string(name), 0).first;
        it->second += delta;
        value = it->second;
    }
    send_watch(level, name, {std::to_string(value), WatchType::Integer});
}

void Session::inc_counter(std::string_view name) { step_counter(sink_.default_level(), name, 1); }
void Session::inc_counter(Level level, std::string_view name) { step_counter(level, name, 1); }
void Session::dec_counter(std::string_view name) { step_counter(sink_.default_level(), name, -1); }
void Session::dec_counter(Level level, std::string_view name) { step_counter(level, name, -1); }

void Session::reset_counter(std::string_view name) {
    std::lock_guard lock(mutex_);
    if (auto it = counters_.find(name); it != counters_.end()) counters_.erase(it);
}

int64_t Session::counter(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

void Session::add_checkpoint() {
    const Level level = sink_.default_level();
    if (!is_on(level)) return;

    int64_t n = 0;
    {
        std::lock_guard lock(mutex_);
        n = ++checkpoint_counter_;
    }
    send_log_entry(level, "Checkpoint #" + std::to_string(n), LogEntryType::Checkpoint,
                   ViewerId::Title);
}

void Session::add_checkpoint(std::string_view name, std::string_view details) {
    add_checkpoint(sink_.default_level(), name, details);
}

void Session::add_checkpoint(Level level, std::string_view name, std::string_view details) {
    if (name.empty()) {
        add_checkpoint();
        return;
    }
    if (!is_on(level)) return;

    int64_t n = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = checkpoints_.find(name);
        if (it == checkpoints_.end()) it = checkpoints_.emplace(std::string(name), 0).first;
        n = ++it->second;
    }
    std::string title = std::string(name) + " #" + std::to_string(n);
    if (!details.empty()) title += " (" + std::string(details) + ")";
    send_log_entry(level, title, LogEntryType::Checkpoint, ViewerId::Title);
}

void Session::reset_checkpoint(std::string_view name) {
    std::lock_guard lock(mutex_);
    if (name.empty()) {
        checkpoint_counter_ = 0;
    } else if (auto it = checkpoints_.find(name); it != checkpoints_.end()) {
        checkpoints_.erase(it);
    }
}

void Session::time_start(std::string_view name) {
    {
        std::lock_guard lock(mutex_);
        timers_.insert_or_assign(std::string(name), std::chrono::steady_clock::now());
    }
    log_message("Timer \"" + std::string(name) + "\" started");
}

void Session::time_end(std::string_view name) {
    std::optional<SteadyTime> started;
    {
        std::lock_guard lock(mutex_);
        if (auto it = timers_.find(name); it != timers_.end()) {
            started = it->second;
            timers_.erase(it);
        }
    }
    if (!started) {
        log_warning("Timer \"" + std::string(name) + "\" not found");
        return;
    }

    const double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - *started).count();
    watch_float(name, elapsed_ms);

    char text[64];
    std::snprintf(text, sizeof(text), "%.3fms", elapsed_ms);
    log_message("Timer \"" + std::string(name) + "\": " + text);
}

// ─────────────────────────────────────────────
// Process flow
// ─────────────────────────────────────────────

void Session::enter_method(std::string_view name) { enter_method(sink_.default_level(), name); }

void Session::enter_method(Level level, std::string_view name) {
    if (!is_on(level)) return;
    send_log_entry(level, name, LogEntryType::EnterMethod, ViewerId::Title);
    send_process_flow(level, name, ProcessFlowType::EnterMethod);
}

void Session::leave_method(std::string_view name) { leave_method(sink_.default_level(), name); }

void Session::leave_method(Level level, std::string_view name) {
    if (!is_on(level)) return;
    send_log_entry(level, name, LogEntryType::LeaveMethod, ViewerId::Title);
    send_process_flow(level, name, ProcessFlowType::LeaveMethod);
}

MethodScope Session::track_method(std::string name) {
    return MethodScope(*this, sink_.default_level(), std::move(name));
}

MethodScope Session::track_method(Level level, std::string name) {
    return MethodScope(*this, level, std::move(name));
}

void Session::enter_thread(std::string_view name) {
    send_process_flow(sink_.default_level(), name, ProcessFlowType::EnterThread);
}

void Session::leave_thread(std::string_view name) {
    send_process_flow(sink_.default_level(), name, ProcessFlowType::LeaveThread);
}

void Session::enter_process(std::string_view name) {
    const Level level = sink_.default_level();
    if (!is_on(level)) return;
    const std::string process = name.empty() ? sink_.app_name() : std::string(name);
    send_process_flow(level, process, ProcessFlowType::EnterProcess);
    send_process_flow(level, kMainThreadName, ProcessFlowType::EnterThread);
}

void Session::leave_process(std::string_view name) {
    const Level level = sink_.default_level();
    if (!is_on(level)) return;
    const std::string process = name.empty() ? sink_.app_name() : std::string(name);
    send_process_flow(level, kMainThreadName, ProcessFlowType::LeaveThread);
    send_process_flow(level, process, ProcessFlowType::LeaveProcess);
}

void Session::reset_callstack() { reset_callstack(sink_.default_level()); }

void Session::reset_callstack(Level level) {
    send_log_entry(level, {}, LogEntryType::ResetCallstack, ViewerId::Title);
}

// ─────────────────────────────────────────────
// Control commands
// ─────────────────────────────────────────────

void Session::clear_all()          { send_control_command(ControlCommandType::ClearAll); }
void Session::clear_log()          { send_control_command(ControlCommandType::ClearLog); }
void Session::clear_watches()      { send_control_command(ControlCommandType::ClearWatches); }
void Session::clear_auto_views()   { send_control_command(ControlCommandType::ClearAutoViews); }
void Session::clear_process_flow() { send_control_command(ControlCommandType::ClearProcessFlow); }

}  // namespace log_courier
