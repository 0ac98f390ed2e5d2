#pragma once
#include "sw/config.hpp"
#include <string>

namespace sw {

// Tamamı bir sayı olarak okunabiliyor mu (strtod)
bool looks_number(const char* s);

void print_help();

// false + err: konfigürasyon hatası. help=true: -h/--help görüldü, gerisi okunmadı.
// Döngü bayrakları cf'ye ham olarak yazılır; make_cycle_policy() ile doğrulanır.
bool parse_cli(int argc, const char* const* argv, Params& p, CycleFlags& cf,
               bool& help, std::string& err);

} // namespace sw
