// main.cpp: SdrWatch (geniş bant tarayıcı + baseline + bandplan; uzaktan STOP)
#include "sw/config.hpp"
#include "sw/cli.hpp"
#include "sw/ctrl_server.hpp"
#include "sw/bandplan.hpp"
#include "sw/sim_source.hpp"
#include "sw/sqlite_store.hpp"
#include "sw/sinks.hpp"
#include "sw/sweep_controller.hpp"
#ifdef SW_WITH_PLUTO
#include "sw/pluto_source.hpp"
#endif

#include <string>
#include <cstdio>
#include <iostream>
#include <memory>
#include <atomic>
#include <csignal>

enum ExitCode { EXIT_OK = 0, EXIT_CONFIG = 1, EXIT_HARDWARE = 2, EXIT_STORAGE = 3 };

// Ctrl+C -> stop_flag
static std::atomic<bool> g_stop{false};
static void on_sigint(int){ g_stop.store(true, std::memory_order_release); }

// ------------------------------------------------------------
static std::unique_ptr<sw::ISource> open_source(const sw::Params& p) {
    if (p.driver == "sim") {
        return std::make_unique<sw::SimSource>(p.samp_rate, p.sim_noise_std, p.sim_tones, p.sim_seed);
    }
#ifdef SW_WITH_PLUTO
    sw::PlutoConfig pcfg;
    pcfg.uri        = p.uri;
    pcfg.center_hz  = static_cast<uint64_t>(p.start_hz);
    pcfg.samp_hz    = static_cast<uint64_t>(p.samp_rate);
    pcfg.rfbw_hz    = static_cast<uint64_t>(p.samp_rate);
    pcfg.frame_len  = p.fft_size;
    pcfg.rx_gain_db = p.gain_db;
    auto src = std::make_unique<sw::PlutoSource>(pcfg);
    if (!src->ok()) return nullptr;
    return src;
#else
    std::cerr << "[ERR] built without Pluto support (SDRWATCH_WITH_PLUTO=OFF); use --driver sim\n";
    return nullptr;
#endif
}

int main(int argc, char** argv) {
    std::signal(SIGINT,  on_sigint);
#ifdef SIGTERM
    std::signal(SIGTERM, on_sigint);
#endif

    // --- Konfigürasyon: hepsi doğrulanmadan hiçbir şey açılmaz ---
    sw::Params p;
    sw::CycleFlags cf;
    bool help = false;
    std::string err;
    if (argc == 1) { sw::print_help(); return EXIT_OK; }
    if (!sw::parse_cli(argc, argv, p, cf, help, err)) {
        std::cerr << "[ERR] " << err << "\n";
        return EXIT_CONFIG;
    }
    if (help) { sw::print_help(); return EXIT_OK; }

    auto policy = sw::make_cycle_policy(cf, err);
    if (!policy) { std::cerr << "[ERR] " << err << "\n"; return EXIT_CONFIG; }
    p.cycle = *policy;
    if (!sw::validate(p, err)) { std::cerr << "[ERR] " << err << "\n"; return EXIT_CONFIG; }

    std::string udp_host;
    uint16_t udp_port = 0;
    if (!p.udp_target.empty() && !sw::parse_host_port(p.udp_target, udp_host, udp_port)) {
        std::cerr << "[ERR] --udp expects host:port\n";
        return EXIT_CONFIG;
    }

    std::cout << "[INFO] Sweep " << p.start_hz << ".." << p.stop_hz
              << " | Step=" << p.step_hz
              << " | Samp=" << p.samp_rate
              << " | FFT=" << p.fft_size << "x" << p.avg
              << " | Gain=" << (p.gain_db ? std::to_string(*p.gain_db) : std::string("auto"))
              << " | CFAR=" << (p.cfar_mode == sw::CfarMode::Off ? "off" : "os")
              << " | Cycle=" << sw::cycle_name(p.cycle)
              << "\n";

    // Bandplan: bozuk dosya ölümcül değil
    sw::Bandplan bandplan;
    if (!p.bandplan_path.empty()) bandplan.load_csv(p.bandplan_path);

    // Depo
    sw::SqliteStore store(p.db_path);
    if (!store.ok()) {
        std::cerr << "[ERR] database " << p.db_path << " unusable\n";
        return EXIT_STORAGE;
    }

    // Kaynak
    auto src = open_source(p);
    if (!src) {
        std::cerr << "[ERR] source '" << p.driver << "' could not be opened\n";
        return EXIT_HARDWARE;
    }

    // Sink'ler
    std::unique_ptr<sw::JsonlSink> jsonl;
    std::unique_ptr<sw::DesktopNotifier> notifier;
    std::unique_ptr<sw::UdpNotifier> udp;

    sw::SweepController ctl(*src, store, bandplan, p, g_stop);
    if (!p.jsonl_path.empty()) { jsonl = std::make_unique<sw::JsonlSink>(p.jsonl_path); ctl.add_sink(jsonl.get()); }
    if (p.notify)              { notifier = std::make_unique<sw::DesktopNotifier>(); ctl.add_sink(notifier.get()); }
    if (!p.udp_target.empty()) {
        udp = std::make_unique<sw::UdpNotifier>(udp_host, udp_port);
        if (!udp->ok()) std::cerr << "[WARN] UDP notifier " << p.udp_target << " not available; continuing\n";
        ctl.add_sink(udp.get());
    }

    // Dış kontrol kanalı
    std::unique_ptr<sw::CtrlServer> ctrl;
    if (p.ctrl_port > 0) {
        ctrl = std::make_unique<sw::CtrlServer>(g_stop, static_cast<uint16_t>(p.ctrl_port));
        if (!ctrl->start()) {
            std::cerr << "[WARN] control server did not start (127.0.0.1:" << p.ctrl_port << "); use Ctrl+C\n";
        } else {
            std::cout << "[CTRL] UDP control listening on 127.0.0.1:" << p.ctrl_port << " (send 'STOP').\n";
        }
    }

    const sw::SweepOutcome out = ctl.run();
    src->close();
    if (ctrl) ctrl->stop();

    std::cout << "[INFO] " << sw::outcome_name(out)
              << " | cycles=" << ctl.cycles_completed()
              << " | windows=" << ctl.windows_processed()
              << " | detections=" << ctl.detections_total() << "\n";

    switch (out) {
        case sw::SweepOutcome::Completed:
        case sw::SweepOutcome::Cancelled:     return EXIT_OK;
        case sw::SweepOutcome::SourceFailed:  return EXIT_HARDWARE;
        case sw::SweepOutcome::StorageFailed: return EXIT_STORAGE;
    }
    return EXIT_OK;
}
