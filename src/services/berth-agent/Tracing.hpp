#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if BERTH_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

struct SpanHandle {
    std::string traceparent;
    bool valid = false;
#if BERTH_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartSpan(const std::string& name);
    // Child spans share the parent's trace id so a whole migration reads as one trace.
    SpanHandle StartChildSpan(const std::string& name, const SpanHandle& parent);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void RecordError(SpanHandle& handle, const std::string& kind, const std::string& message);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

    static std::string TraceIdOf(const std::string& traceparent);

private:
    Tracer() = default;

    bool enabled_ = false;
#if BERTH_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// Ends the span on scope exit; failed unless MarkSuccess was called.
class ScopedSpan {
public:
    ScopedSpan(const std::string& name, const SpanHandle* parent = nullptr);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    SpanHandle& Handle() { return handle_; }
    void MarkSuccess() { success_ = true; }

private:
    SpanHandle handle_;
    bool success_ = false;
};
