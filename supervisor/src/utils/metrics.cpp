#include "metrics.hpp"

namespace rtmp2rtsp::utils {

Metrics& Metrics::Instance() {
    static Metrics instance;
    return instance;
}

Metrics::Metrics() : registry_(std::make_shared<prometheus::Registry>()) {
    EnsureMetricsCreated();
}

void Metrics::Init(const std::string& addr) {
    if (exposer_ || addr.empty()) return;
    exposer_ = std::make_unique<prometheus::Exposer>(addr);
    exposer_->RegisterCollectable(registry_);
}

void Metrics::EnsureMetricsCreated() {
    if (workers_active_) return;
    if (!registry_) registry_ = std::make_shared<prometheus::Registry>();

    workers_active_ = &prometheus::BuildGauge()
                           .Name("relay_workers_active")
                           .Help("Number of registered transcoding workers")
                           .Register(*registry_)
                           .Add({});

    worker_starts_total_ = &prometheus::BuildCounter()
                                .Name("relay_worker_starts_total")
                                .Help("Total number of workers launched")
                                .Register(*registry_)
                                .Add({});

    worker_exits_total_ = &prometheus::BuildCounter()
                               .Name("relay_worker_exits_total")
                               .Help("Total number of workers that exited without being stopped")
                               .Register(*registry_)
                               .Add({});

    worker_force_kills_total_ = &prometheus::BuildCounter()
                                     .Name("relay_worker_force_kills_total")
                                     .Help("Total number of workers killed after the stop grace period")
                                     .Register(*registry_)
                                     .Add({});

    worker_restarts_total_ = &prometheus::BuildCounter()
                                  .Name("relay_worker_restarts_total")
                                  .Help("Total number of automatic worker restarts")
                                  .Register(*registry_)
                                  .Add({});

    reconcile_passes_total_ = &prometheus::BuildCounter()
                                   .Name("relay_reconcile_passes_total")
                                   .Help("Total number of reconciliation passes")
                                   .Register(*registry_)
                                   .Add({});

    streams_configured_ = &prometheus::BuildGauge()
                               .Name("relay_streams_configured")
                               .Help("Number of streams in the store")
                               .Register(*registry_)
                               .Add({});

    errors_family_ = &prometheus::BuildCounter()
                          .Name("relay_errors_total")
                          .Help("Total number of errors by type")
                          .Register(*registry_);
}

prometheus::Gauge& Metrics::workers_active() { return *workers_active_; }
prometheus::Counter& Metrics::worker_starts_total() { return *worker_starts_total_; }
prometheus::Counter& Metrics::worker_exits_total() { return *worker_exits_total_; }
prometheus::Counter& Metrics::worker_force_kills_total() { return *worker_force_kills_total_; }
prometheus::Counter& Metrics::worker_restarts_total() { return *worker_restarts_total_; }
prometheus::Counter& Metrics::reconcile_passes_total() { return *reconcile_passes_total_; }
prometheus::Gauge& Metrics::streams_configured() { return *streams_configured_; }

prometheus::Counter& Metrics::errors_total(const std::string& type) {
    return errors_family_->Add({{"type", type}});
}

} // namespace rtmp2rtsp::utils
