#include <flatlock/detect.hpp>
#include <flatlock/lang/parser.hpp>
#include <flatlock/log.hpp>
#include <json/json.h>

#include <memory>
#include <sstream>

namespace flatlock {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Parsed views of the content, computed at most once per detection
class ProbeContext {
public:
    explicit ProbeContext(const std::string& content) : content_(content) {}

    const std::string& content() const { return content_; }

    // nullptr when the content is not valid YAML
    const YAML::Node* yaml() {
        if (!yaml_tried_) {
            yaml_tried_ = true;
            try {
                yaml_ = YAML::Load(content_);
                yaml_ok_ = true;
            } catch (const YAML::Exception&) {
                yaml_ok_ = false;
            }
        }
        return yaml_ok_ ? &yaml_ : nullptr;
    }

private:
    const std::string& content_;
    YAML::Node yaml_;
    bool yaml_tried_ = false;
    bool yaml_ok_ = false;
};

bool probe_npm(ProbeContext& ctx) {
    return is_npm_lockfile(ctx.content());
}

bool probe_yarn_berry(ProbeContext& ctx) {
    const YAML::Node* root = ctx.yaml();
    if (!root || !root->IsMap()) return false;
    YAML::Node meta = (*root)["__metadata"];
    return meta.IsDefined() && meta.IsMap() && meta["version"].IsDefined();
}

bool probe_pnpm(ProbeContext& ctx) {
    const YAML::Node* root = ctx.yaml();
    if (!root || !root->IsMap()) return false;
    if ((*root)["__metadata"].IsDefined()) return false;
    return (*root)["lockfileVersion"].IsDefined() ||
           (*root)["shrinkwrapVersion"].IsDefined();
}

bool probe_yarn_classic(ProbeContext& ctx) {
    return is_yarn_classic_lockfile(ctx.content());
}

struct FormatProbe {
    LockfileFormat format;
    bool (*matches)(ProbeContext&);
};

// Structured formats first; the permissive v1 grammar last
const FormatProbe k_format_probes[] = {
    {LockfileFormat::Npm,         probe_npm},
    {LockfileFormat::YarnBerry,   probe_yarn_berry},
    {LockfileFormat::Pnpm,        probe_pnpm},
    {LockfileFormat::YarnClassic, probe_yarn_classic},
};

struct EraRule {
    PnpmEra era;
    bool (*matches)(const PnpmVersionField&);
};

const EraRule k_era_rules[] = {
    {PnpmEra::Shrinkwrap, [](const PnpmVersionField& f) {
        return f.has_shrinkwrap;
    }},
    {PnpmEra::V5, [](const PnpmVersionField& f) {
        return f.kind == PnpmVersionField::Number;
    }},
    {PnpmEra::V5Inline, [](const PnpmVersionField& f) {
        return f.kind == PnpmVersionField::String &&
               f.text.find("inlineSpecifiers") != std::string::npos;
    }},
    {PnpmEra::V9, [](const PnpmVersionField& f) {
        return f.kind == PnpmVersionField::String && starts_with(f.text, "9");
    }},
    {PnpmEra::V6, [](const PnpmVersionField& f) {
        return f.kind == PnpmVersionField::String && starts_with(f.text, "6");
    }},
};

} // namespace

// ---------------------------------------------------------------------------
// Format probes
// ---------------------------------------------------------------------------

bool is_npm_lockfile(const std::string& content) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(content.data(), content.data() + content.size(),
                       &root, &errs)) {
        return false;
    }
    if (!root.isObject()) return false;
    // lockfileVersion must be a number at the root
    const Json::Value& version = root["lockfileVersion"];
    return version.isNumeric();
}

bool is_yarn_berry_lockfile(const std::string& content) {
    ProbeContext ctx(content);
    return probe_yarn_berry(ctx);
}

bool is_pnpm_lockfile(const std::string& content) {
    ProbeContext ctx(content);
    return probe_pnpm(ctx);
}

bool is_yarn_classic_lockfile(const std::string& content) {
    auto doc = parse_yarn_lock(content);
    if (doc.is_err()) return false;

    bool has_entries = false;
    for (const auto& node : doc.value().entries) {
        if (node.key == "__metadata") return false;
        if (node.is_block) has_entries = true;
    }
    return has_entries;
}

std::optional<LockfileFormat> format_from_path(const std::string& path) {
    if (ends_with(path, "package-lock.json") ||
        ends_with(path, "npm-shrinkwrap.json")) {
        return LockfileFormat::Npm;
    }
    if (ends_with(path, "pnpm-lock.yaml") || ends_with(path, "shrinkwrap.yaml")) {
        return LockfileFormat::Pnpm;
    }
    if (ends_with(path, "yarn.lock")) {
        // Without content, default to classic
        return LockfileFormat::YarnClassic;
    }
    return std::nullopt;
}

Result<LockfileFormat> detect_format(const std::string& content,
                                     const std::string& path_hint) {
    if (!content.empty()) {
        ProbeContext ctx(content);
        for (const auto& probe : k_format_probes) {
            if (probe.matches(ctx)) {
                log::debug("detected %s lockfile%s%s", format_name(probe.format),
                           path_hint.empty() ? "" : " ",
                           path_hint.c_str());
                return Result<LockfileFormat>::ok(probe.format);
            }
        }
        // Content that matches no format never falls back to the path
        return FlatlockError{FlatlockError::Detection,
            "unable to detect lockfile format: content does not match any known format",
            "pass an explicit format: npm, pnpm, yarn-classic or yarn-berry",
            path_hint, 0};
    }

    if (!path_hint.empty()) {
        if (auto format = format_from_path(path_hint)) {
            log::debug("guessed %s lockfile from path %s",
                       format_name(*format), path_hint.c_str());
            return Result<LockfileFormat>::ok(*format);
        }
    }

    return FlatlockError{FlatlockError::Detection,
        "unable to detect lockfile format",
        "provide lockfile content or a recognizable lockfile name"};
}

// ---------------------------------------------------------------------------
// pnpm eras
// ---------------------------------------------------------------------------

const char* pnpm_era_name(PnpmEra era) {
    switch (era) {
        case PnpmEra::Shrinkwrap: return "shrinkwrap";
        case PnpmEra::V5:         return "v5";
        case PnpmEra::V5Inline:   return "v5-inline";
        case PnpmEra::V6:         return "v6";
        case PnpmEra::V9:         return "v9";
        case PnpmEra::Unknown:    return "unknown";
    }
    return "unknown";
}

PnpmVersion classify_pnpm_version(const PnpmVersionField& field) {
    for (const auto& rule : k_era_rules) {
        if (!rule.matches(field)) continue;

        PnpmVersion v;
        v.era = rule.era;
        if (rule.era == PnpmEra::Shrinkwrap) {
            v.version = field.shrinkwrap_version;
            v.is_shrinkwrap = true;
        } else {
            v.version = field.text;
        }
        return v;
    }

    PnpmVersion unknown;
    unknown.version = field.kind == PnpmVersionField::Absent ? "" : field.text;
    return unknown;
}

PnpmVersion detect_pnpm_version(const YAML::Node& root) {
    PnpmVersionField field;
    if (!root.IsDefined() || !root.IsMap()) {
        return classify_pnpm_version(field);
    }

    YAML::Node shrinkwrap = root["shrinkwrapVersion"];
    if (shrinkwrap.IsDefined()) {
        field.has_shrinkwrap = true;
        if (shrinkwrap.IsScalar()) field.shrinkwrap_version = shrinkwrap.Scalar();
    }

    YAML::Node version = root["lockfileVersion"];
    if (version.IsDefined() && !version.IsNull()) {
        field.kind = PnpmVersionField::String;
        if (version.IsScalar()) {
            field.text = version.Scalar();
            double number = 0;
            // Quoted scalars carry the "!" tag; only plain scalars may be numbers
            if (version.Tag() != "!" &&
                YAML::convert<double>::decode(version, number)) {
                field.kind = PnpmVersionField::Number;
            }
        }
    }

    return classify_pnpm_version(field);
}

bool uses_at_separator(const PnpmVersion& v) {
    return v.era == PnpmEra::V6 || v.era == PnpmEra::V9;
}

bool uses_snapshots_split(const PnpmVersion& v) {
    return v.era == PnpmEra::V9;
}

bool uses_inline_specifiers(const PnpmVersion& v) {
    return v.era == PnpmEra::V5Inline || v.era == PnpmEra::V6 ||
           v.era == PnpmEra::V9;
}

bool has_leading_slash(const PnpmVersion& v) {
    return v.era != PnpmEra::V9;
}

} // namespace flatlock
