#include "codegen/envelope_extractor.hpp"

#include <boost/variant/get.hpp>

namespace kestrel::codegen
{

namespace
{

namespace ast = idl::ast;

bool has_type_name(const ast::Type& type, const std::string& name)
{
    const auto* user = boost::get<ast::UserType>(&type);
    return user != nullptr && user->name.to_string() == name;
}

void append_once(std::vector<const ast::StructLike*>& records, const ast::StructLike* record)
{
    // records are scanned one at a time, so a repeat is always the last entry
    if (records.empty() || records.back() != record) {
        records.push_back(record);
    }
}

}  // namespace

const std::vector<EnvelopeRule>& default_envelope_rules()
{
    static const std::vector<EnvelopeRule> rules{
        {"base", "base.Base", EnvelopeRole::Request},
        {"baseResp", "base.BaseResp", EnvelopeRole::Response},
    };
    return rules;
}

EnvelopeMatch extract_envelopes(const ast::Document& document,
                                const NameNormalizer& unexport,
                                const std::vector<EnvelopeRule>& rules)
{
    EnvelopeMatch match;
    for (const auto* record : ast::struct_likes_of(document)) {
        for (const auto& field : record->fields) {
            const auto name = unexport(field.name);
            for (const auto& rule : rules) {
                if (name != rule.field_name || !has_type_name(field.type, rule.type_name)) {
                    continue;
                }
                append_once(rule.role == EnvelopeRole::Request ? match.requests : match.responses, record);
            }
        }
    }
    return match;
}

}  // namespace kestrel::codegen
