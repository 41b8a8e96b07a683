#pragma once
#include <prometheus/registry.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/counter.h>
#include <memory>
#include <string>

namespace rtmp2rtsp::utils {

class Metrics {
public:
    static Metrics& Instance();

    // Starts the HTTP exposer. Without it metrics are still collected.
    void Init(const std::string& addr);

    prometheus::Gauge& workers_active();
    prometheus::Counter& worker_starts_total();
    prometheus::Counter& worker_exits_total();
    prometheus::Counter& worker_force_kills_total();
    prometheus::Counter& worker_restarts_total();
    prometheus::Counter& reconcile_passes_total();
    prometheus::Gauge& streams_configured();
    prometheus::Counter& errors_total(const std::string& type);

private:
    Metrics();
    void EnsureMetricsCreated();
    std::shared_ptr<prometheus::Registry> registry_;
    std::unique_ptr<prometheus::Exposer> exposer_;

    prometheus::Gauge* workers_active_ = nullptr;
    prometheus::Counter* worker_starts_total_ = nullptr;
    prometheus::Counter* worker_exits_total_ = nullptr;
    prometheus::Counter* worker_force_kills_total_ = nullptr;
    prometheus::Counter* worker_restarts_total_ = nullptr;
    prometheus::Counter* reconcile_passes_total_ = nullptr;
    prometheus::Gauge* streams_configured_ = nullptr;
    prometheus::Family<prometheus::Counter>* errors_family_ = nullptr;
};

} // namespace rtmp2rtsp::utils
