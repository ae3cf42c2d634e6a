#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "config.hpp"

using json = nlohmann::json;
using namespace std;

/* ───────────── numeric flag values ───────────── */
namespace {

int to_int(const string& flag, const string& v)
{
    size_t pos = 0;
    int    out = 0;
    try {
        out = stoi(v, &pos);
    } catch (const std::logic_error&) {
        throw ConfigError("bad integer for " + flag + ": '" + v + "'");
    }
    if (pos != v.size()) throw ConfigError("bad integer for " + flag + ": '" + v + "'");
    return out;
}

double to_num(const string& flag, const string& v)
{
    double out = 0;
    if (!parse_double(v, out)) throw ConfigError("bad number for " + flag + ": '" + v + "'");
    return out;
}

uint32_t to_seed(const string& flag, const string& v)
{
    const int s = to_int(flag, v);
    if (s < 0) throw ConfigError(flag + " must be >= 0");
    return uint32_t(s);
}

/* ---- JSON helpers: absent key leaves the field alone ---- */
template <class T>
void get_opt(const json& j, const char* key, T& dst)
{
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) dst = it->get<T>();
}

void read_embed(const json& j, EmbedOpt& e)
{
    get_opt(j, "dim",       e.dim);
    get_opt(j, "window",    e.window);
    get_opt(j, "min_count", e.min_count);
    get_opt(j, "epochs",    e.epochs);
    get_opt(j, "negative",  e.negative);
    get_opt(j, "min_n",     e.min_n);
    get_opt(j, "max_n",     e.max_n);
    get_opt(j, "bucket",    e.bucket);
    get_opt(j, "sample",    e.sample);
    get_opt(j, "alpha",     e.alpha);
    get_opt(j, "seed",      e.seed);
}

VariantConfig read_variant(const json& j)
{
    VariantConfig v;
    if (j.is_string()) {                        // "fasttext_gbdt" shorthand
        v.kind = parse_variant(j.get<string>());
        return v;
    }
    string key = "fasttext_lr";
    get_opt(j, "model", key);
    v.kind = parse_variant(key);
    get_opt(j, "name",             v.name);
    get_opt(j, "max_iter",         v.opt.max_iter);
    get_opt(j, "C",                v.opt.C);
    get_opt(j, "tol",              v.opt.tol);
    get_opt(j, "trees",            v.opt.trees);
    get_opt(j, "lr",               v.opt.lr);
    get_opt(j, "num_leaves",       v.opt.num_leaves);
    get_opt(j, "min_data_in_leaf", v.opt.min_data_in_leaf);
    get_opt(j, "hidden",           v.opt.hidden1);
    get_opt(j, "epochs",           v.opt.epochs);
    get_opt(j, "batch_size",       v.opt.batch_size);
    get_opt(j, "threads",          v.opt.threads);
    get_opt(j, "seed",             v.opt.seed);
    return v;
}

vector<VariantConfig> variants_from_list(const string& csv)
{
    vector<VariantConfig> out;
    for (const auto& t : split(csv, ',')) {
        if (trim(t).empty()) continue;
        VariantConfig v;
        v.kind = parse_variant(t);
        out.push_back(v);
    }
    if (out.empty()) throw ConfigError("--models is empty");
    return out;
}

} // namespace


void load_config_json(const string& path, BenchConfig& cfg)
{
    ifstream in(path);
    if (!in) throw ConfigError("cannot open config " + path);

    try {
        json j = json::parse(in);
        if (!j.is_object()) throw ConfigError("config root must be an object: " + path);

        get_opt(j, "data_file",      cfg.data_file);
        get_opt(j, "test_file",      cfg.test_file);
        get_opt(j, "eval_unlabeled", cfg.eval_unlabeled);
        get_opt(j, "threads",        cfg.threads);
        get_opt(j, "checkpoint_dir", cfg.checkpoint_dir);
        get_opt(j, "save_vectors",   cfg.save_vectors);
        get_opt(j, "output_json",    cfg.output_json);
        get_opt(j, "output_csv",     cfg.output_csv);

        if (j.contains("embedding")) read_embed(j.at("embedding"), cfg.embed);

        if (j.contains("variants")) {
            const json& vs = j.at("variants");
            if (!vs.is_array() || vs.empty())
                throw ConfigError("'variants' must be a non-empty array");
            cfg.variants.clear();
            for (const auto& v : vs) cfg.variants.push_back(read_variant(v));
        }
    } catch (const json::exception& e) {
        throw ConfigError("config " + path + ": " + e.what());
    }
    logI("config loaded ← " + path);
}


BenchConfig parse_cli(int argc, char* argv[])
{
    BenchConfig cfg;

    /* pass 1: --config, then --models (both reshape what pass 2 tunes) */
    for (int i = 1; i < argc; ++i) {
        string a(argv[i]);
        if (a.rfind("--config=",0)==0) load_config_json(a.substr(9), cfg);
    }
    for (int i = 1; i < argc; ++i) {
        string a(argv[i]);
        if (a.rfind("--models=",0)==0) cfg.variants = variants_from_list(a.substr(9));
    }

    /* pass 2: everything else; model flags apply to every variant */
    auto each = [&](auto fn){ for (auto& v : cfg.variants) fn(v.opt); };

    for (int i = 1; i < argc; ++i) {
        string a(argv[i]);
        if      (a.rfind("--config=",0)==0 || a.rfind("--models=",0)==0) continue;
        else if (a.rfind("--data_file=",0)==0)       cfg.data_file      = a.substr(12);
        else if (a.rfind("--test_file=",0)==0)       cfg.test_file      = a.substr(12);
        else if (a == "--eval_unlabeled")            cfg.eval_unlabeled = true;
        else if (a.rfind("--threads=",0)==0)         cfg.threads        = to_int("--threads", a.substr(10));
        else if (a.rfind("--checkpoint_dir=",0)==0)  cfg.checkpoint_dir = a.substr(17);
        else if (a.rfind("--save_vectors=",0)==0)    cfg.save_vectors   = a.substr(15);
        else if (a.rfind("--output_json=",0)==0)     cfg.output_json    = a.substr(14);
        else if (a.rfind("--output_csv=",0)==0)      cfg.output_csv     = a.substr(13);
        /* ---- embedding ---- */
        else if (a.rfind("--fasttext_epochs=",0)==0) cfg.embed.epochs    = to_int("--fasttext_epochs", a.substr(18));
        else if (a.rfind("--dim=",0)==0)             cfg.embed.dim       = to_int("--dim", a.substr(6));
        else if (a.rfind("--window=",0)==0)          cfg.embed.window    = to_int("--window", a.substr(9));
        else if (a.rfind("--min_count=",0)==0)       cfg.embed.min_count = to_int("--min_count", a.substr(12));
        else if (a.rfind("--bucket=",0)==0)          cfg.embed.bucket    = to_int("--bucket", a.substr(9));
        else if (a.rfind("--seed=",0)==0) {
            const uint32_t s = to_seed("--seed", a.substr(7));
            cfg.embed.seed = s;
            each([&](TrainOpt& o){ o.seed = s; });
        }
        /* ---- classifiers ---- */
        else if (a.rfind("--max_iter=",0)==0) {
            const int v = to_int("--max_iter", a.substr(11));
            each([&](TrainOpt& o){ o.max_iter = v; });
        }
        else if (a.rfind("--epochs=",0)==0) {
            const int v = to_int("--epochs", a.substr(9));
            each([&](TrainOpt& o){ o.epochs = v; });
        }
        else if (a.rfind("--batch_size=",0)==0) {
            const int v = to_int("--batch_size", a.substr(13));
            each([&](TrainOpt& o){ o.batch_size = v; });
        }
        else if (a.rfind("--hidden=",0)==0) {
            const int v = to_int("--hidden", a.substr(9));
            each([&](TrainOpt& o){ o.hidden1 = v; });
        }
        else if (a.rfind("--trees=",0)==0) {
            const int v = to_int("--trees", a.substr(8));
            each([&](TrainOpt& o){ o.trees = v; });
        }
        else if (a.rfind("--lr=",0)==0) {
            const double v = to_num("--lr", a.substr(5));
            each([&](TrainOpt& o){ o.lr = v; });
        }
        else logW("ignored arg: " + a);
    }

    /* LightGBM follows the OpenMP setting unless a variant pins it */
    if (cfg.threads > 0)
        each([&](TrainOpt& o){ if (o.threads == 0) o.threads = cfg.threads; });

    return cfg;
}
