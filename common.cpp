#include <cerrno>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/stat.h>   // stat / mkdir
#include <unistd.h>     // access

#include "common.hpp"

using namespace std;

/* ───────────── Dataset ───────────── */
const char* provenance_name(Provenance p)
{
    return p == Provenance::Fallback ? "fallback" : "real";
}

Dataset::Dataset(vector<Record> records, Provenance prov,
                 bool labels_authoritative, string source)
    : records_(std::move(records)),
      prov_(prov),
      labels_ok_(labels_authoritative),
      source_(std::move(source))
{}

vector<string> Dataset::texts() const
{
    vector<string> out;
    out.reserve(records_.size());
    for (const auto& r : records_) out.push_back(r.text);
    return out;
}

vector<float> Dataset::labels() const
{
    vector<float> out;
    out.reserve(records_.size());
    for (const auto& r : records_) out.push_back(r.label);
    return out;
}

map<float, size_t> label_histogram(const Dataset& ds)
{
    map<float, size_t> h;
    for (const auto& r : ds.records()) ++h[r.label];
    return h;
}


/* ───────────── logging ───────────── */
void logI(const string&s){ cerr<<"[INFO]  "<<s<<'\n'; }
void logW(const string&s){ cerr<<"[WARN]  "<<s<<'\n'; }
void logE(const string&s){ cerr<<"[ERR]   "<<s<<'\n'; }


/* ———— file / directory helpers ———— */
bool file_exists(const string& p){
    return ::access(p.c_str(), F_OK) == 0;
}
bool is_directory(const string& p){
    struct stat sb{};
    return ::stat(p.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}
bool ensure_dir(const string& p){
    if (is_directory(p)) return true;
    return ::mkdir(p.c_str(), 0755) == 0 || errno == EEXIST;
}

void progress(const string&tag,size_t cur,size_t tot,size_t W){
    double f=tot?double(cur)/tot:1.0; size_t filled=size_t(f*W);
    cerr<<"\r"<<tag<<" ["<<string(filled,'=')<<string(W-filled,' ')
        <<"] "<<setw(3)<<int(f*100)<<"% ("<<cur<<'/'<<tot<<')'<<flush;
    if(cur==tot) cerr<<'\n';
}

double now_sec(){
    using hrc = chrono::steady_clock;
    return chrono::duration<double>(hrc::now().time_since_epoch()).count();
}


/* ─────────────────────────────  utilities  ────────────────────────────── */
string trim(const string& s){
    size_t b = 0, e = s.size();
    while (b < e && isspace((unsigned char)s[b]))     ++b;
    while (e > b && isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

string to_lower(string s){
    for (char& c : s) c = (char)tolower((unsigned char)c);
    return s;
}

vector<string> split(const string& s, char sep){
    vector<string> out;
    string tok;
    stringstream ss(s);
    while (getline(ss, tok, sep)) out.push_back(tok);
    return out;
}

bool parse_double(const string& raw, double& out){
    const string s = trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size()) return false;
    if (std::isnan(v)) return false;
    out = v;
    return true;
}
