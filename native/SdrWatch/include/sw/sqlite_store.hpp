// sw/sqlite_store.hpp
#pragma once
#include "sw/store.hpp"
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace sw {

class SqliteStore : public IStore {
public:
    // ":memory:" testler için
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Açılış + şema + statement hazırlığı başarılı mı
    bool ok() const { return ok_; }

    std::optional<int64_t> start_scan(const ScanMeta& m) override;
    bool end_scan(int64_t scan_id, const std::string& t_end_utc) override;

    bool begin_window() override;
    bool commit_window() override;
    void rollback_window() override;

    bool add_detection(const Detection& d) override;

    bool get_bin(int64_t bin_hz, std::optional<BaselineBin>& out) override;
    bool put_bin(const BaselineBin& b) override;

    // Testler / teşhis için
    sqlite3* raw() const { return db_; }
    bool exec(const char* sql);

private:
    bool init_schema();
    bool prepare_all();
    bool fail(const char* what);

    std::string path_;
    sqlite3* db_ = nullptr;
    bool ok_ = false;
    bool in_tx_ = false;

    sqlite3_stmt* st_start_scan_ = nullptr;
    sqlite3_stmt* st_end_scan_   = nullptr;
    sqlite3_stmt* st_add_det_    = nullptr;
    sqlite3_stmt* st_get_bin_    = nullptr;
    sqlite3_stmt* st_put_bin_    = nullptr;
};

} // namespace sw
