#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if ZONE_DRIVER_ENABLE_OTEL
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
#if ZONE_DRIVER_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

private:
    Tracer() = default;

    bool enabled_ = false;
#if ZONE_DRIVER_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// Ends the span on scope exit unless End() was called; failure is the
// default so an exception leaves the span marked as an error.
class ScopedSpan {
public:
    explicit ScopedSpan(const std::string& name);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void Set(const std::string& key, const std::string& value);
    void Set(const std::string& key, int64_t value);
    void End(bool success);

private:
    SpanHandle handle_;
    bool ended_ = false;
};
