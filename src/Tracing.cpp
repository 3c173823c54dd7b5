#include "Tracing.hpp"

#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#if ZIPWRIGHT_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kInstrumentationName = "zipwright";

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

std::string LocalTraceParent() {
    return "00-" + RandomHex(16) + "-" + RandomHex(8) + "-01";
}

#if ZIPWRIGHT_ENABLE_OTEL
std::string TraceParentOf(const opentelemetry::trace::SpanContext& context) {
    if (!context.IsValid()) {
        return LocalTraceParent();
    }

    return "00-" + context.trace_id().ToLowerBase16() + "-" + context.span_id().ToLowerBase16() + "-"
        + (context.trace_flags().IsSampled() ? "01" : "00");
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    enabled_ = false;
    if (!config.enabled) {
        return;
    }

#if ZIPWRIGHT_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(std::move(exporter));
    auto resource = opentelemetry::sdk::resource::Resource::Create(
        {{"service.name", config.serviceName.empty() ? std::string(kInstrumentationName) : config.serviceName}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(kInstrumentationName);
    enabled_ = true;
#else
    std::cout << "[WARN] Tracing requested but OpenTelemetry support is not compiled in." << std::endl;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
#if ZIPWRIGHT_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        handle.traceparent = TraceParentOf(handle.span->GetContext());
        return handle;
    }
#endif

    (void)name;
    handle.traceparent = LocalTraceParent();
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if ZIPWRIGHT_ENABLE_OTEL
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
#if ZIPWRIGHT_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
#if ZIPWRIGHT_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)handle;
    (void)success;
#endif
}

void Tracer::Shutdown() {
#if ZIPWRIGHT_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
    enabled_ = false;
}
