#include "Tracing.hpp"

#include <iomanip>
#include <random>
#include <sstream>

#if BERTH_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kServiceName = "berth-agent";

std::string RandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}

std::string BuildTraceParent(const std::string& traceId, const std::string& spanId) {
    return "00-" + traceId + "-" + spanId + "-01";
}

#if BERTH_ENABLE_OTEL
std::string BuildTraceParentFromContext(const opentelemetry::trace::SpanContext& context) {
    if (!context.IsValid()) {
        return BuildTraceParent(RandomHex(16), RandomHex(8));
    }

    char traceId[32];
    char spanId[16];
    context.trace_id().ToLowerBase16(traceId);
    context.span_id().ToLowerBase16(spanId);
    return "00-" + std::string(traceId, sizeof(traceId)) + "-" + std::string(spanId, sizeof(spanId)) + "-"
           + (context.trace_flags().IsSampled() ? "01" : "00");
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if BERTH_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(std::move(exporter));
    auto resource = opentelemetry::sdk::resource::Resource::Create(
        {{"service.name", config.serviceName.empty() ? kServiceName : config.serviceName}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(kServiceName);
    enabled_ = true;
#else
    (void)config;
    enabled_ = false;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
#if BERTH_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        handle.traceparent = BuildTraceParentFromContext(handle.span->GetContext());
        handle.valid = true;
        return handle;
    }
#else
    (void)name;
#endif

    handle.traceparent = BuildTraceParent(RandomHex(16), RandomHex(8));
    handle.valid = true;
    return handle;
}

SpanHandle Tracer::StartChildSpan(const std::string& name, const SpanHandle& parent) {
    SpanHandle handle;
#if BERTH_ENABLE_OTEL
    if (enabled_ && tracer_ && parent.span) {
        opentelemetry::trace::StartSpanOptions options;
        options.parent = parent.span->GetContext();
        handle.span = tracer_->StartSpan(name, options);
        handle.traceparent = BuildTraceParentFromContext(handle.span->GetContext());
        handle.valid = true;
        return handle;
    }
#endif

    const std::string traceId = TraceIdOf(parent.traceparent);
    if (traceId.empty()) {
        return StartSpan(name);
    }
    handle.traceparent = BuildTraceParent(traceId, RandomHex(8));
    handle.valid = true;
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if BERTH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if BERTH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::RecordError(SpanHandle& handle, const std::string& kind, const std::string& message) {
    SetAttribute(handle, "error.kind", kind);
    SetAttribute(handle, "error.message", message);
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
#if BERTH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)success;
#endif
    handle.valid = false;
}

void Tracer::Shutdown() {
#if BERTH_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
}

std::string Tracer::TraceIdOf(const std::string& traceparent) {
    // 00-<32 hex trace id>-<16 hex span id>-<flags>
    if (traceparent.size() != 55 || traceparent[2] != '-' || traceparent[35] != '-') {
        return {};
    }
    return traceparent.substr(3, 32);
}

ScopedSpan::ScopedSpan(const std::string& name, const SpanHandle* parent)
    : handle_(parent != nullptr ? Tracer::Instance().StartChildSpan(name, *parent) : Tracer::Instance().StartSpan(name)) {}

ScopedSpan::~ScopedSpan() {
    if (handle_.valid) {
        Tracer::Instance().EndSpan(handle_, success_);
    }
}
