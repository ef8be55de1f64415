// Replays a recorded gyro stream through the pipeline:
//   reader thread: csv line -> SpscQueue
//   main thread:   SpscQueue -> Pipeline::update -> printed events
//
// usage: gpc_replay <samples.csv> [config.yaml]
// csv: t_us,gx,gy,gz,accel_y   ('#' comments and one header line are skipped)

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include "gpc/config.hpp"
#include "gpc/config_io.hpp"
#include "gpc/logger.hpp"
#include "gpc/pipeline.hpp"
#include "gpc/spsc_queue.hpp"

namespace {

struct Record {
    gpc::SensorSample sample{};
    bool malformed = false;
    int line = 0;
};

class PrintSink : public gpc::EventSink {
public:
    void on_event(const gpc::ControlEvent& e) override {
        std::printf("%6llu  t=%10.3f s  %-12s intensity=%.2f confidence=%.2f\n",
                    static_cast<unsigned long long>(e.seq), double(e.t_us) * 1e-6,
                    gpc::to_string(e.type), e.intensity, e.confidence);
    }
};

bool is_blank(const std::string& s){
    for (char c : s) if (!std::isspace(static_cast<unsigned char>(c))) return false;
    return true;
}

// strict field parse, every field must be consumed up to the separator
bool parse_line(const std::string& line, gpc::SensorSample& out){
    const char* p = line.c_str();
    char* end = nullptr;

    const unsigned long long t = std::strtoull(p, &end, 10);
    if (end == p || *end != ',') return false;
    p = end + 1;

    float g[3];
    for (int i = 0; i < 3; ++i) {
        g[i] = std::strtof(p, &end);
        if (end == p || *end != ',') return false;
        p = end + 1;
    }

    const long a = std::strtol(p, &end, 10);
    if (end == p) return false;
    while (*end && std::isspace(static_cast<unsigned char>(*end))) ++end;
    if (*end != '\0') return false;

    out.t_us = t;
    out.gyro = {g[0], g[1], g[2]};
    out.accel_y = static_cast<int32_t>(a);
    return true;
}

void push_blocking(gpc::SpscQueue<Record>& q, const Record& r){
    using namespace std::chrono_literals;
    while (!q.try_push(r)) std::this_thread::sleep_for(1ms);
}

void reader_thread_fn(std::ifstream& in, gpc::SpscQueue<Record>& q, std::atomic<int>& lines){
    std::string line;
    int n = 0;
    bool seen_data = false;
    while (std::getline(in, line)) {
        ++n;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_blank(line) || line[0] == '#') continue;

        Record r;
        r.line = n;
        if (!parse_line(line, r.sample)) {
            //first non numeric line before any data is the header
            if (!seen_data && std::isalpha(static_cast<unsigned char>(line[0]))) {
                seen_data = true;
                continue;
            }
            r.malformed = true;
            GPC_LOG_DBG("replay", "line " << n << " unreadable: " << line);
        }
        seen_data = true;
        push_blocking(q, r);
    }
    lines.store(n, std::memory_order_relaxed);
    q.close();
}

void print_summary(const gpc::Pipeline& p){
    const gpc::GateStats& g = p.gate().stats();
    std::printf("\ncalibration: %s", gpc::to_string(p.calibrator().status()));
    if (p.calibrator().has_profile()) {
        const gpc::CalibrationProfile& prof = p.calibrator().profile();
        std::printf(" (%s, %d samples, offset %.3f %.3f %.3f)", gpc::to_string(prof.mode), prof.sample_count,
                    prof.offset.x, prof.offset.y, prof.offset.z);
    }
    std::printf("\nsamples: accepted=%llu rejected=%llu\n",
                static_cast<unsigned long long>(g.accepted), static_cast<unsigned long long>(g.rejected));
    for (int i = 1; i < static_cast<int>(gpc::SampleError::Count); ++i) {
        const auto e = static_cast<gpc::SampleError>(i);
        if (g.count(e)) std::printf("  %-16s %llu\n", gpc::to_string(e), static_cast<unsigned long long>(g.count(e)));
    }
    std::printf("events:\n");
    for (int i = 0; i < static_cast<int>(gpc::ControlEventType::Count); ++i) {
        const auto t = static_cast<gpc::ControlEventType>(i);
        std::printf("  %-12s %llu\n", gpc::to_string(t), static_cast<unsigned long long>(p.emitter().count(t)));
    }
    std::printf("forward triggers: %d\n", p.classifier().forward_triggers());
}

}   // namespace

int main(int argc, char** argv){
    if (argc < 2 || argc > 3) {
        std::fprintf(stderr, "usage: %s <samples.csv> [config.yaml]\n", argv[0]);
        return 1;
    }

    gpc::PipelineConfig cfg{};
    if (argc == 3) {
        std::string err;
        if (!gpc::load_config_file(argv[2], cfg, &err)) {
            std::fprintf(stderr, "config error: %s\n", err.c_str());
            return 1;
        }
        GPC_LOG_INFO("replay", "config " << argv[2]);
    }

    std::ifstream in(argv[1]);
    if (!in) {
        std::fprintf(stderr, "cannot open %s\n", argv[1]);
        return 1;
    }

    PrintSink sink;
    gpc::Pipeline pipeline(&sink);
    if (!pipeline.init(cfg)) return 1;

    gpc::SpscQueue<Record> q(256);
    std::atomic<int> lines{0};
    std::thread reader(reader_thread_fn, std::ref(in), std::ref(q), std::ref(lines));

    using namespace std::chrono_literals;
    bool reported_exhausted = false;
    Record r;
    for (;;) {
        if (!q.try_pop(r)) {
            if (!q.closed()) {
                std::this_thread::sleep_for(1ms);
                continue;
            }
            //closed was seen first, so an empty queue now means the reader is done
            if (!q.try_pop(r)) break;
        }
        if (r.malformed) {
            pipeline.report_malformed();
            continue;
        }
        const gpc::PipelineOutputs o = pipeline.update(r.sample);
        if (o.calibrating && o.calibration.exhausted && !reported_exhausted) {
            std::fprintf(stderr, "calibration failed at line %d, no retries left\n", r.line);
            reported_exhausted = true;
        }
    }
    reader.join();

    GPC_LOG_INFO("replay", lines.load() << " lines read");
    print_summary(pipeline);
    return 0;
}
