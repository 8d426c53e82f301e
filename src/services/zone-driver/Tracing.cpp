#include "Tracing.hpp"

#if ZONE_DRIVER_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/status_code.h>
#endif

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if ZONE_DRIVER_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(std::move(exporter));
    auto resource = opentelemetry::sdk::resource::Resource::Create(
        {{"service.name", config.serviceName.empty() ? "zone-driver" : config.serviceName}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(
        std::move(processor),
        resource);

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer("zone-driver");
    enabled_ = true;
#else
    (void)config;
    enabled_ = false;
#endif
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
#if ZONE_DRIVER_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
    }
#else
    (void)name;
#endif
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if ZONE_DRIVER_ENABLE_OTEL
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
#if ZONE_DRIVER_ENABLE_OTEL
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
#if ZONE_DRIVER_ENABLE_OTEL
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
#if ZONE_DRIVER_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
}

ScopedSpan::ScopedSpan(const std::string& name)
    : handle_(Tracer::Instance().StartSpan(name)) {}

ScopedSpan::~ScopedSpan() {
    End(false);
}

void ScopedSpan::Set(const std::string& key, const std::string& value) {
    Tracer::Instance().SetAttribute(handle_, key, value);
}

void ScopedSpan::Set(const std::string& key, int64_t value) {
    Tracer::Instance().SetAttribute(handle_, key, value);
}

void ScopedSpan::End(bool success) {
    if (ended_) {
        return;
    }
    ended_ = true;
    Tracer::Instance().EndSpan(handle_, success);
}
