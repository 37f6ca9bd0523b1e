#include "gff/gff.hpp"

#include <iomanip>
#include <locale>
#include <sstream>

namespace gff {

static std::string join(const std::string& path, const std::string& step) {
    return path.empty() ? step : path + "\\" + step;
}

std::string to_display_string(const GffValue& v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    switch (static_cast<GffFieldType>(v.index())) {
        case GffFieldType::UInt8: oss << static_cast<unsigned>(std::get<std::uint8_t>(v)); break;
        case GffFieldType::Int8: oss << static_cast<int>(std::get<std::int8_t>(v)); break;
        case GffFieldType::UInt16: oss << std::get<std::uint16_t>(v); break;
        case GffFieldType::Int16: oss << std::get<std::int16_t>(v); break;
        case GffFieldType::UInt32: oss << std::get<std::uint32_t>(v); break;
        case GffFieldType::Int32: oss << std::get<std::int32_t>(v); break;
        case GffFieldType::UInt64: oss << std::get<std::uint64_t>(v); break;
        case GffFieldType::Int64: oss << std::get<std::int64_t>(v); break;
        case GffFieldType::Single: oss << std::setprecision(9) << std::get<float>(v); break;
        case GffFieldType::Double: oss << std::setprecision(17) << std::get<double>(v); break;
        case GffFieldType::String: oss << '"' << std::get<std::string>(v) << '"'; break;
        case GffFieldType::ResRef: oss << '"' << std::get<ResRef>(v).str() << '"'; break;
        case GffFieldType::LocString: {
            const auto& loc = std::get<LocalizedString>(v);
            oss << "strref=" << loc.stringref();
            for (const auto& kv : loc.substrings()) {
                oss << " [" << kv.first << "]=\"" << kv.second << '"';
            }
            break;
        }
        case GffFieldType::Binary: oss << std::get<Binary>(v).size() << " bytes"; break;
        case GffFieldType::Struct: oss << "struct"; break;
        case GffFieldType::List: oss << std::get<GffList>(v).size() << " entries"; break;
        case GffFieldType::Vector4: {
            const auto& q = std::get<Vector4>(v);
            oss << '(' << q.x << ", " << q.y << ", " << q.z << ", " << q.w << ')';
            break;
        }
        case GffFieldType::Vector3: {
            const auto& p = std::get<Vector3>(v);
            oss << '(' << p.x << ", " << p.y << ", " << p.z << ')';
            break;
        }
        case GffFieldType::StrRef: oss << std::get<StrRef>(v).id; break;
    }
    return oss.str();
}

static void report(const CompareLog& log, const std::string& line) {
    if (log) log(line);
}

bool compare(const GffStruct& a, const GffStruct& b, const CompareLog& log, const std::string& path) {
    const std::string where = path.empty() ? "<root>" : path;
    bool same = true;

    if (a.type_id() != b.type_id()) {
        report(log, where + ": struct type id " + std::to_string(a.type_id()) + " != " + std::to_string(b.type_id()));
        same = false;
    }

    for (const auto& fa : a) {
        const std::string at = join(path, fa.label());
        const GffField* fb = b.field(fa.label());
        if (!fb) {
            report(log, at + ": missing from second (" + to_string(fa.type()) + ")");
            same = false;
            continue;
        }
        if (fa.type() != fb->type()) {
            report(log, at + ": type " + to_string(fa.type()) + " != " + to_string(fb->type()));
            same = false;
            continue;
        }

        if (fa.type() == GffFieldType::Struct) {
            if (!compare(std::get<GffStruct>(fa.value), std::get<GffStruct>(fb->value), log, at)) same = false;
        } else if (fa.type() == GffFieldType::List) {
            const auto& la = std::get<GffList>(fa.value);
            const auto& lb = std::get<GffList>(fb->value);
            if (la.size() != lb.size()) {
                report(log, at + ": list length " + std::to_string(la.size()) + " != " + std::to_string(lb.size()));
                same = false;
            }
            const std::size_t n = la.size() < lb.size() ? la.size() : lb.size();
            for (std::size_t i = 0; i < n; ++i) {
                if (!compare(la[i], lb[i], log, join(at, std::to_string(i)))) same = false;
            }
        } else if (fa.value != fb->value) {
            report(log, at + ": " + to_display_string(fa.value) + " != " + to_display_string(fb->value));
            same = false;
        }
    }

    for (const auto& fb : b) {
        if (!a.exists(fb.label())) {
            report(log, join(path, fb.label()) + ": missing from first (" + to_string(fb.type()) + ")");
            same = false;
        }
    }

    return same;
}

} // namespace gff
