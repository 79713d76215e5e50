#include "JSONWriter.h"
#include <sstream>
#include <map>
#include <vector>
#include <cstdlib>
#include <sys/utsname.h>
#include "JsonUtil.h"
#include "BuildInfo.h"

namespace asset_scan {
namespace {

    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM, T_LIT } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // string contents, number text or literal (true/false/null)
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    using jsonutil::escape;

    static void canon_emit(const CanonVal& v, std::ostream& os);

    static void emit_array(const CanonVal& v, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            canon_emit(e, os);
        }
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(kv.first) << '"' << ':';
            canon_emit(kv.second, os);
        }
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os) {
        switch (v.type) {
            case CanonVal::T_STR: os << '"' << escape(v.str) << '"'; break;
            case CanonVal::T_NUM:
            case CanonVal::T_LIT: os << v.str; break;
            case CanonVal::T_ARR: emit_array(v, os); break;
            case CanonVal::T_OBJ: emit_object(v, os); break;
        }
    }

    static CanonVal str_val(const std::string& s) { CanonVal v{CanonVal::T_STR}; v.str = s; return v; }
    static CanonVal num_val(long long n) { CanonVal v{CanonVal::T_NUM}; v.str = std::to_string(n); return v; }
    static CanonVal dbl_val(double d) { CanonVal v{CanonVal::T_NUM}; v.str = jsonutil::format_double(d); return v; }
    static CanonVal bool_val(bool b) { CanonVal v{CanonVal::T_LIT}; v.str = b ? "true" : "false"; return v; }
    static CanonVal null_val() { CanonVal v{CanonVal::T_LIT}; v.str = "null"; return v; }

    static CanonVal str_array(const std::vector<std::string>& items) {
        CanonVal a{CanonVal::T_ARR};
        for (const auto& s : items) a.arr.push_back(str_val(s));
        return a;
    }

    static CanonVal str_map(const std::map<std::string, std::string>& m) {
        CanonVal o{CanonVal::T_OBJ};
        for (const auto& kv : m) o.obj[kv.first] = str_val(kv.second);
        return o;
    }

    template <typename T>
    static CanonVal count_map(const std::map<std::string, T>& m) {
        CanonVal o{CanonVal::T_OBJ};
        for (const auto& kv : m) o.obj[kv.first] = num_val(static_cast<long long>(kv.second));
        return o;
    }

    static bool zero_time() { return std::getenv("ASSET_SCAN_CANON_TIME_ZERO") != nullptr; }

    static std::string iso(std::chrono::system_clock::time_point tp) {
        if (zero_time()) return "";
        return jsonutil::time_to_iso(tp);
    }

    static long long duration_ms(std::chrono::system_clock::time_point a, std::chrono::system_clock::time_point b) {
        if (zero_time()) return 0;
        if (!a.time_since_epoch().count() || !b.time_since_epoch().count() || b < a) return 0;
        return std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count();
    }

    static std::string hostname() {
        if (const char* v = std::getenv("ASSET_SCAN_META_HOSTNAME"); v && *v) return v;
        struct utsname u{};
        if (uname(&u) == 0) return u.nodename;
        return "";
    }

    static CanonVal build_meta(const DiscoveryReport& r) {
        CanonVal meta{CanonVal::T_OBJ};
        meta.obj["tool_version"] = str_val(buildinfo::APP_VERSION);
        meta.obj["git_commit"] = str_val(buildinfo::GIT_COMMIT);
        meta.obj["json_schema_version"] = str_val("1");
        meta.obj["hostname"] = str_val(hostname());
        meta.obj["report_id"] = str_val(r.report_id);
        meta.obj["start_time"] = str_val(iso(r.start_time));
        meta.obj["end_time"] = str_val(iso(r.end_time));
        meta.obj["duration_ms"] = num_val(duration_ms(r.start_time, r.end_time));
        meta.obj["truncated"] = bool_val(r.truncated);
        if (zero_time()) meta.obj["normalized_time"] = bool_val(true);
        return meta;
    }

    static CanonVal asset_val(const DiscoveredAsset& a) {
        CanonVal o{CanonVal::T_OBJ};
        o.obj["asset_id"] = str_val(a.asset_id);
        o.obj["asset_type"] = str_val(asset_type_to_string(a.asset_type));
        o.obj["locators"] = str_array(a.locators);
        o.obj["identity_keys"] = str_array(a.identity_keys);
        CanonVal methods{CanonVal::T_ARR};
        for (auto m : a.supporting_methods) methods.arr.push_back(str_val(method_to_string(m)));
        o.obj["supporting_methods"] = methods;
        o.obj["observation_count"] = num_val(static_cast<long long>(a.observation_count));
        o.obj["confidence_score"] = dbl_val(a.confidence_score);
        o.obj["confidence_level"] = str_val(confidence_level_to_string(a.confidence_level));
        o.obj["attributes"] = str_map(a.attributes);
        o.obj["validated"] = bool_val(a.validated);
        o.obj["validation_errors"] = str_array(a.validation_errors);
        return o;
    }

    static CanonVal gap_val(const GapPriorityScore& s, size_t rank) {
        const Gap& g = s.gap;
        CanonVal o{CanonVal::T_OBJ};
        o.obj["rank"] = num_val(static_cast<long long>(rank));
        o.obj["gap_id"] = str_val(g.gap_id);
        o.obj["kind"] = str_val(gap_kind_to_string(g.kind));
        o.obj["asset_id"] = g.asset_id ? str_val(*g.asset_id) : null_val();
        o.obj["detected_at"] = str_val(iso(g.detected_at));
        o.obj["severity"] = str_val(severity_to_string(g.severity));
        o.obj["evidence"] = str_array(g.evidence);
        if (g.kind == GapKind::Documentation) {
            CanonVal issues{CanonVal::T_ARR};
            for (auto i : g.issues) issues.arr.push_back(str_val(documentation_issue_to_string(i)));
            o.obj["issues"] = issues;
            if (!g.entry_key.empty()) o.obj["entry_key"] = str_val(g.entry_key);
        }
        if (g.kind == GapKind::Compliance) {
            o.obj["framework"] = str_val(g.framework);
            o.obj["rule_id"] = str_val(g.rule_id);
            o.obj["violated_rule"] = str_val(g.violated_rule);
        }
        CanonVal factors{CanonVal::T_OBJ};
        for (const auto& kv : s.contributing_factors) factors.obj[kv.first] = dbl_val(kv.second);
        o.obj["composite_score"] = dbl_val(s.composite_score);
        o.obj["contributing_factors"] = factors;
        o.obj["priority_level"] = str_val(priority_level_to_string(s.priority_level));
        o.obj["effort_hours"] = dbl_val(s.effort_hours);
        o.obj["team"] = str_val(s.team);
        return o;
    }

    static CanonVal module_val(const ModuleRun& m) {
        CanonVal o{CanonVal::T_OBJ};
        o.obj["name"] = str_val(m.name);
        o.obj["method"] = str_val(method_to_string(m.method));
        o.obj["status"] = str_val(module_status_to_string(m.status));
        o.obj["observation_count"] = num_val(static_cast<long long>(m.observation_count));
        o.obj["duration_ms"] = num_val(duration_ms(m.start_time, m.end_time));
        o.obj["truncated"] = bool_val(m.status == ModuleStatus::Partial || m.status == ModuleStatus::Abandoned);
        if (!m.reason.empty()) o.obj["reason"] = str_val(m.reason);
        return o;
    }

    static CanonVal warning_val(const RunWarning& w) {
        CanonVal o{CanonVal::T_OBJ};
        o.obj["source"] = str_val(w.source);
        o.obj["code"] = str_val(warn_code_to_string(w.code));
        o.obj["detail"] = str_val(w.detail);
        return o;
    }

    static CanonVal validation_val(const ValidationError& e) {
        CanonVal o{CanonVal::T_OBJ};
        o.obj["source"] = str_val(e.source);
        o.obj["line"] = num_val(static_cast<long long>(e.line));
        o.obj["code"] = str_val(warn_code_to_string(e.code));
        o.obj["detail"] = str_val(e.detail);
        return o;
    }

    static CanonVal statistics_val(const ReportStatistics& st) {
        CanonVal o{CanonVal::T_OBJ};
        o.obj["total_assets"] = num_val(static_cast<long long>(st.total_assets));
        o.obj["total_observations"] = num_val(static_cast<long long>(st.total_observations));
        o.obj["total_gaps"] = num_val(static_cast<long long>(st.total_gaps));
        o.obj["validated_assets"] = num_val(static_cast<long long>(st.validated_assets));
        o.obj["credential_exposures"] = num_val(static_cast<long long>(st.credential_exposures));
        o.obj["assets_by_type"] = count_map(st.assets_by_type);
        o.obj["assets_by_method"] = count_map(st.assets_by_method);
        o.obj["assets_by_confidence"] = count_map(st.assets_by_confidence);
        o.obj["gaps_by_kind"] = count_map(st.gaps_by_kind);
        o.obj["gaps_by_severity"] = count_map(st.gaps_by_severity);
        return o;
    }

    static CanonVal plan_val(const ResourcePlan& p) {
        CanonVal o{CanonVal::T_OBJ};
        o.obj["immediate"] = num_val(static_cast<long long>(p.immediate));
        o.obj["scheduled"] = num_val(static_cast<long long>(p.scheduled));
        o.obj["total_effort_hours"] = dbl_val(p.total_effort_hours);
        o.obj["gaps_by_team"] = count_map(p.gaps_by_team);
        CanonVal hours{CanonVal::T_OBJ};
        for (const auto& kv : p.hours_by_team) hours.obj[kv.first] = dbl_val(kv.second);
        o.obj["hours_by_team"] = hours;
        return o;
    }

    static CanonVal build_canonical(const DiscoveryReport& r) {
        CanonVal root{CanonVal::T_OBJ};
        root.obj["meta"] = build_meta(r);
        CanonVal assets{CanonVal::T_ARR};
        for (const auto& a : r.assets) assets.arr.push_back(asset_val(a));
        root.obj["assets"] = assets;
        CanonVal gaps{CanonVal::T_ARR};
        for (size_t i = 0; i < r.gaps.size(); ++i) gaps.arr.push_back(gap_val(r.gaps[i], i + 1));
        root.obj["gaps"] = gaps;
        CanonVal modules{CanonVal::T_ARR};
        CanonVal skipped{CanonVal::T_ARR};
        for (const auto& m : r.modules) {
            modules.arr.push_back(module_val(m));
            if (m.status == ModuleStatus::Skipped) {
                CanonVal s{CanonVal::T_OBJ};
                s.obj["name"] = str_val(m.name);
                s.obj["reason"] = str_val(m.reason);
                skipped.arr.push_back(s);
            }
        }
        root.obj["modules"] = modules;
        root.obj["skipped_modules"] = skipped;
        CanonVal warnings{CanonVal::T_ARR};
        for (const auto& w : r.warnings) warnings.arr.push_back(warning_val(w));
        root.obj["warnings"] = warnings;
        CanonVal errors{CanonVal::T_ARR};
        for (const auto& e : r.validation_errors) errors.arr.push_back(validation_val(e));
        root.obj["validation_errors"] = errors;
        CanonVal skipped_rules{CanonVal::T_ARR};
        for (const auto& s : r.skipped_rules) {
            CanonVal o{CanonVal::T_OBJ};
            o.obj["rule_id"] = str_val(s.rule_id);
            o.obj["reason"] = str_val(s.reason);
            skipped_rules.arr.push_back(o);
        }
        root.obj["skipped_rules"] = skipped_rules;
        root.obj["statistics"] = statistics_val(r.statistics);
        root.obj["resource_plan"] = plan_val(r.resource_plan);
        return root;
    }

    static std::string emit_line(const CanonVal& v) {
        std::ostringstream os;
        canon_emit(v, os);
        os << '\n';
        return os.str();
    }

    static std::string generate_ndjson_output(const DiscoveryReport& r) {
        std::string nd;
        CanonVal meta = build_meta(r);
        meta.obj["type"] = str_val("meta");
        nd += emit_line(meta);
        CanonVal summary = statistics_val(r.statistics);
        summary.obj["type"] = str_val("summary");
        summary.obj["resource_plan"] = plan_val(r.resource_plan);
        nd += emit_line(summary);
        for (const auto& m : r.modules) {
            CanonVal o = module_val(m);
            o.obj["type"] = str_val("module");
            nd += emit_line(o);
        }
        for (const auto& a : r.assets) {
            CanonVal o = asset_val(a);
            o.obj["type"] = str_val("asset");
            nd += emit_line(o);
        }
        for (size_t i = 0; i < r.gaps.size(); ++i) {
            CanonVal o = gap_val(r.gaps[i], i + 1);
            o.obj["type"] = str_val("gap");
            nd += emit_line(o);
        }
        for (const auto& w : r.warnings) {
            CanonVal o = warning_val(w);
            o.obj["type"] = str_val("warning");
            nd += emit_line(o);
        }
        for (const auto& e : r.validation_errors) {
            CanonVal o = validation_val(e);
            o.obj["type"] = str_val("validation_error");
            nd += emit_line(o);
        }
        return nd;
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;

        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };

        for (size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            out.push_back(c);

            if (esc) { esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { in_string = !in_string; continue; }
            if (in_string) continue;

            switch (c) {
                case '{':
                case '[':
                    // Keep empty containers on one line.
                    if (i + 1 < compact_json.size() && (compact_json[i + 1] == '}' || compact_json[i + 1] == ']')) {
                        out.push_back(compact_json[++i]);
                        break;
                    }
                    out.push_back('\n');
                    depth++;
                    indent(depth);
                    break;
                case '}':
                case ']':
                    out.pop_back();
                    out.push_back('\n');
                    depth--;
                    if (depth < 0) depth = 0;
                    indent(depth);
                    out.push_back(c);
                    break;
                case ',':
                    out.push_back('\n');
                    indent(depth);
                    break;
                case ':':
                    out.push_back(' ');
                    break;
                default:
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }

}

std::string JSONWriter::write(const DiscoveryReport& report, const Config& cfg) const {
    if (cfg.ndjson) {
        return generate_ndjson_output(report);
    }
    std::ostringstream os;
    canon_emit(build_canonical(report), os);
    std::string compact = os.str();
    if (cfg.pretty && !cfg.compact) {
        return pretty_print_json(compact);
    }
    return compact;
}

}
