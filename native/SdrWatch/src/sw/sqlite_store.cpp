// sw/sqlite_store.cpp
#include "sw/sqlite_store.hpp"
#include <sqlite3.h>
#include <cstdio>
#include <limits>

namespace sw {

static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS scans (
  id          INTEGER PRIMARY KEY AUTOINCREMENT,
  t_start_utc TEXT NOT NULL,
  t_end_utc   TEXT,
  f_start_hz  INTEGER,
  f_stop_hz   INTEGER,
  step_hz     INTEGER,
  samp_rate   INTEGER,
  fft_size    INTEGER,
  avg         INTEGER,
  device      TEXT,
  driver      TEXT
);
CREATE TABLE IF NOT EXISTS detections (
  id          INTEGER PRIMARY KEY AUTOINCREMENT,
  scan_id     INTEGER NOT NULL REFERENCES scans(id),
  time_utc    TEXT NOT NULL,
  f_low_hz    INTEGER,
  f_center_hz INTEGER,
  f_high_hz   INTEGER,
  peak_db     REAL,
  noise_db    REAL,
  snr_db      REAL,
  service     TEXT,
  region      TEXT,
  notes       TEXT
);
CREATE TABLE IF NOT EXISTS baseline (
  bin_hz        INTEGER PRIMARY KEY,
  ema_occ       REAL,
  ema_power_db  REAL,
  last_seen_utc TEXT,
  total_obs     INTEGER,
  hits          INTEGER
);
CREATE INDEX IF NOT EXISTS idx_detections_scan   ON detections(scan_id);
CREATE INDEX IF NOT EXISTS idx_detections_center ON detections(f_center_hz);
)SQL";

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::fprintf(stderr, "[DB] cannot open %s: %s\n", path.c_str(),
                     db_ ? sqlite3_errmsg(db_) : "out of memory");
        return;
    }
    sqlite3_busy_timeout(db_, 5000);
    ok_ = init_schema() && prepare_all();
}

SqliteStore::~SqliteStore() {
    if (in_tx_) rollback_window();
    sqlite3_finalize(st_start_scan_);
    sqlite3_finalize(st_end_scan_);
    sqlite3_finalize(st_add_det_);
    sqlite3_finalize(st_get_bin_);
    sqlite3_finalize(st_put_bin_);
    if (db_) sqlite3_close(db_);
}

bool SqliteStore::fail(const char* what) {
    std::fprintf(stderr, "[DB] %s failed: %s\n", what, db_ ? sqlite3_errmsg(db_) : "no database");
    return false;
}

bool SqliteStore::exec(const char* sql) {
    if (!db_) return false;
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::fprintf(stderr, "[DB] exec failed: %s\n", err ? err : "?");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool SqliteStore::init_schema() {
    return exec("PRAGMA foreign_keys = ON;") && exec(kSchema);
}

bool SqliteStore::prepare_all() {
    auto prep = [&](const char* sql, sqlite3_stmt** st) {
        if (sqlite3_prepare_v2(db_, sql, -1, st, nullptr) != SQLITE_OK) return fail("prepare");
        return true;
    };
    return prep("INSERT INTO scans(t_start_utc, t_end_utc, f_start_hz, f_stop_hz, step_hz,"
                " samp_rate, fft_size, avg, device, driver)"
                " VALUES (?, NULL, ?, ?, ?, ?, ?, ?, ?, ?)", &st_start_scan_)
        && prep("UPDATE scans SET t_end_utc = ? WHERE id = ? AND t_end_utc IS NULL", &st_end_scan_)
        && prep("INSERT INTO detections(scan_id, time_utc, f_low_hz, f_center_hz, f_high_hz,"
                " peak_db, noise_db, snr_db, service, region, notes)"
                " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", &st_add_det_)
        && prep("SELECT ema_occ, ema_power_db, last_seen_utc, total_obs, hits"
                " FROM baseline WHERE bin_hz = ?", &st_get_bin_)
        && prep("INSERT INTO baseline(bin_hz, ema_occ, ema_power_db, last_seen_utc, total_obs, hits)"
                " VALUES (?, ?, ?, ?, ?, ?)"
                " ON CONFLICT(bin_hz) DO UPDATE SET"
                "  ema_occ=excluded.ema_occ,"
                "  ema_power_db=excluded.ema_power_db,"
                "  last_seen_utc=excluded.last_seen_utc,"
                "  total_obs=excluded.total_obs,"
                "  hits=excluded.hits", &st_put_bin_);
}

std::optional<int64_t> SqliteStore::start_scan(const ScanMeta& m) {
    if (!ok_) return std::nullopt;
    sqlite3_stmt* st = st_start_scan_;
    sqlite3_reset(st);
    sqlite3_bind_text (st, 1, m.t_start_utc.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(m.f_start_hz));
    sqlite3_bind_int64(st, 3, static_cast<sqlite3_int64>(m.f_stop_hz));
    sqlite3_bind_int64(st, 4, static_cast<sqlite3_int64>(m.step_hz));
    sqlite3_bind_int64(st, 5, static_cast<sqlite3_int64>(m.samp_rate));
    sqlite3_bind_int  (st, 6, m.fft_size);
    sqlite3_bind_int  (st, 7, m.avg);
    sqlite3_bind_text (st, 8, m.device.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text (st, 9, m.driver.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(st);
    sqlite3_reset(st);
    if (rc != SQLITE_DONE) { fail("start_scan"); return std::nullopt; }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

bool SqliteStore::end_scan(int64_t scan_id, const std::string& t_end_utc) {
    if (!ok_) return false;
    sqlite3_stmt* st = st_end_scan_;
    sqlite3_reset(st);
    sqlite3_bind_text (st, 1, t_end_utc.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st, 2, scan_id);
    const int rc = sqlite3_step(st);
    sqlite3_reset(st);
    if (rc != SQLITE_DONE) return fail("end_scan");
    return true;
}

bool SqliteStore::begin_window() {
    if (!ok_) return false;
    if (in_tx_) return fail("begin (nested)");
    if (!exec("BEGIN IMMEDIATE")) return false;
    in_tx_ = true;
    return true;
}

bool SqliteStore::commit_window() {
    if (!in_tx_) return fail("commit (no transaction)");
    if (!exec("COMMIT")) return false;
    in_tx_ = false;
    return true;
}

void SqliteStore::rollback_window() {
    if (!in_tx_) return;
    // Otomatik geri alınmış olabilir; hata sadece loglanır
    if (sqlite3_get_autocommit(db_) == 0) {
        if (!exec("ROLLBACK")) std::fprintf(stderr, "[DB] rollback failed\n");
    }
    in_tx_ = false;
}

bool SqliteStore::add_detection(const Detection& d) {
    if (!ok_) return false;
    sqlite3_stmt* st = st_add_det_;
    sqlite3_reset(st);
    sqlite3_bind_int64 (st, 1, d.scan_id);
    sqlite3_bind_text  (st, 2, d.time_utc.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64 (st, 3, d.seg.f_low_hz);
    sqlite3_bind_int64 (st, 4, d.seg.f_center_hz);
    sqlite3_bind_int64 (st, 5, d.seg.f_high_hz);
    sqlite3_bind_double(st, 6, d.seg.peak_db);
    sqlite3_bind_double(st, 7, d.seg.noise_db);
    sqlite3_bind_double(st, 8, d.seg.snr_db);
    sqlite3_bind_text  (st, 9,  d.label.service.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text  (st, 10, d.label.region.c_str(),  -1, SQLITE_TRANSIENT);
    sqlite3_bind_text  (st, 11, d.label.notes.c_str(),   -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(st);
    sqlite3_reset(st);
    if (rc != SQLITE_DONE) return fail("add_detection");
    return true;
}

bool SqliteStore::get_bin(int64_t bin_hz, std::optional<BaselineBin>& out) {
    if (!ok_) return false;
    sqlite3_stmt* st = st_get_bin_;
    sqlite3_reset(st);
    sqlite3_bind_int64(st, 1, bin_hz);
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        out.reset();
        sqlite3_reset(st);
        return true;
    }
    if (rc != SQLITE_ROW) { sqlite3_reset(st); return fail("get_bin"); }

    BaselineBin b;
    b.bin_hz       = bin_hz;
    // column_type dönüşümden önce okunmalı
    const int occ_type = sqlite3_column_type(st, 0);
    const int pow_type = sqlite3_column_type(st, 1);
    b.ema_occ      = occ_type == SQLITE_NULL ? 0.0 : sqlite3_column_double(st, 0);
    b.ema_power_db = pow_type == SQLITE_NULL ? std::numeric_limits<double>::quiet_NaN()
                                             : sqlite3_column_double(st, 1);
    const unsigned char* ts = sqlite3_column_text(st, 2);
    b.last_seen_utc = ts ? reinterpret_cast<const char*>(ts) : "";
    b.total_obs    = sqlite3_column_int64(st, 3);
    b.hits         = sqlite3_column_int64(st, 4);
    sqlite3_reset(st);
    out = b;
    return true;
}

bool SqliteStore::put_bin(const BaselineBin& b) {
    if (!ok_) return false;
    sqlite3_stmt* st = st_put_bin_;
    sqlite3_reset(st);
    sqlite3_bind_int64 (st, 1, b.bin_hz);
    sqlite3_bind_double(st, 2, b.ema_occ);
    sqlite3_bind_double(st, 3, b.ema_power_db);
    sqlite3_bind_text  (st, 4, b.last_seen_utc.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64 (st, 5, b.total_obs);
    sqlite3_bind_int64 (st, 6, b.hits);
    const int rc = sqlite3_step(st);
    sqlite3_reset(st);
    if (rc != SQLITE_DONE) return fail("put_bin");
    return true;
}

} // namespace sw
