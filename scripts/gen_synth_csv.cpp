#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <random>
#include <fstream>
#include <iostream>

// Writes Excel-style CSV that exercises the splitter: quoted fields with
// commas, "" escapes and embedded line breaks, optionally CRLF records.
int main(int argc, char** argv){
  if (argc < 4){
    std::cerr << "usage: gen_synth_csv <out.csv> <records> <quoted:0|1> [crlf:0|1]\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t records = std::strtoull(argv[2], nullptr, 10);
  const bool quoted = std::string(argv[3]) == "1";
  const bool crlf = argc > 4 && std::string(argv[4]) == "1";
  // the header is record 1, so at least one record is always written
  if (records == 0){ std::cerr << "records must be >= 1\n"; return 2; }
  const char* eol = crlf ? "\r\n" : "\n";

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  // header counts as a record, like any other line
  f << "id,amount,flag,note" << eol;

  std::mt19937_64 rng(42);
  std::uniform_int_distribution<long long> di(-100000, 100000);
  const char* words[] = {"alpha","bravo","charlie","delta","echo","foxtrot"};

  auto emit = [&](const std::string& x){
    if (!quoted) { f << x; return; }
    f << '"';
    for (char c: x){ if (c=='"') f << "\"\""; else f << c; }
    f << '"';
  };

  for (std::uint64_t i=2;i<=records;++i){
    std::string note = words[i % 6];
    if (quoted && (i % 7 == 0))  note += ", said \"hi\"";
    if (quoted && (i % 11 == 0)) note += std::string(eol) + "second line";
    if (quoted && (i % 13 == 0)) note += "\n\n\"\"";

    emit(std::to_string(i)); f << ",";
    f << di(rng) << ",";
    f << ((i % 3) == 0 ? "true" : "false") << ",";
    emit(note);
    // last record sometimes left unterminated
    if (i != records || (records % 2) == 0) f << eol;
  }
  std::cerr << "wrote " << records << " records to " << out << "\n";
  return 0;
}
