#include "templates.hpp"

#include "codegen/output_planner.hpp"

#include <boost/variant/get.hpp>
#include <fmt/format.h>

#include <string_view>

namespace kestrel::codegen::golang
{

namespace
{

namespace ast = idl::ast;

constexpr std::string_view kFastCodecRuntime = "github.com/cloudwego/kitex/pkg/protocol/bthrift";

/**
 * @brief Everything the field templates need to know about one field.
 */
struct FieldView {
    std::string go_name;
    std::string wire_type;
    const ast::BaseType* base = nullptr;  ///< set only for fields declared with a base type
    bool optional = false;
    bool binary_or_string = false;

    bool is_struct() const
    {
        return wire_type == "thrift.STRUCT";
    }

    /// thriftgo keeps optional binary fields as plain slices
    bool is_pointer() const
    {
        return optional && base != nullptr && base->kind != ast::BaseKind::Binary;
    }
};

Result<FieldView> view_of(const RenderContext& ctx, const ast::Field& field)
{
    FieldView view;
    view.go_name = ctx.funcs->go_name(field.name);
    view.base = boost::get<ast::BaseType>(&field.type);
    view.optional = field.requiredness == ast::Requiredness::Optional;

    auto wire_type = ctx.funcs->wire_type(field.type);
    if (!wire_type) {
        return std::unexpected(wire_type.error());
    }
    view.wire_type = std::move(*wire_type);

    auto binary_or_string = ctx.funcs->is_binary_or_string_type(field.type);
    if (!binary_or_string) {
        return std::unexpected(binary_or_string.error());
    }
    view.binary_or_string = *binary_or_string;
    return view;
}

std::string record_name(const RenderContext& ctx)
{
    return ctx.funcs->go_name(ctx.record->name);
}

Result<void> render_file(const RenderContext& ctx, std::ostream& os)
{
    const auto& document = ctx.data->ast->document;

    os << "// Code generated by Kestrel " << ctx.funcs->version() << ". DO NOT EDIT.\n\n";
    os << "package " << ctx.data->package << "\n\n";

    auto result = ctx.templates->execute("imports", ctx, os);
    if (result) {
        result = ctx.templates->execute("unused_protection", ctx, os);
    }
    if (!result) {
        return result;
    }

    if (ctx.funcs->generate_fast_apis()) {
        for (const auto* record : ast::struct_likes_of(document)) {
            if (auto rendered = ctx.templates->execute("struct_like", ctx.with_record(*record), os); !rendered) {
                return rendered;
            }
        }
    }

    if (auto rendered = ctx.templates->execute("envelope", ctx, os); !rendered) {
        return rendered;
    }

    for (const auto* service : ast::services_of(document)) {
        const auto service_name = ctx.funcs->go_name(service->name);
        os << "// Service " << service_name << "\n";
        for (const auto& function : service->functions) {
            const auto prefix = service_name + ctx.funcs->go_name(function.name);
            if (function.oneway) {
                os << fmt::format("//   {}: {}Args (oneway)\n", function.name, prefix);
            } else {
                os << fmt::format("//   {}: {}Args -> {}Result\n", function.name, prefix, prefix);
            }
        }
        os << "\n";
    }
    return {};
}

Result<void> render_imports(const RenderContext& ctx, std::ostream& os)
{
    os << "import (\n"
       << "\t\"bytes\"\n"
       << "\t\"fmt\"\n"
       << "\t\"reflect\"\n"
       << "\t\"strings\"\n\n"
       << "\t\"" << kLegacyThriftRuntime << "\"\n\n"
       << "\t\"" << kFastCodecRuntime << "\"\n";
    for (const auto& [path, alias] : ctx.data->imports) {
        if (alias.empty()) {
            os << "\t\"" << path << "\"\n";
        } else {
            os << "\t" << alias << " \"" << path << "\"\n";
        }
    }
    os << ")\n\n";
    return {};
}

Result<void> render_unused_protection(const RenderContext& ctx, std::ostream& os)
{
    os << "// unused protection\n"
       << "var (\n"
       << "\t_ = fmt.Formatter(nil)\n"
       << "\t_ = (*bytes.Buffer)(nil)\n"
       << "\t_ = (*strings.Builder)(nil)\n"
       << "\t_ = reflect.Type(nil)\n"
       << "\t_ = thrift.TProtocol(nil)\n"
       << "\t_ = bthrift.BinaryWriter(nil)\n";
    for (const auto& name : ctx.funcs->to_package_names(ctx.data->imports)) {
        os << "\t_ = " << name << "." << kProtectionSymbol << "\n";
    }
    os << ")\n\n";
    return {};
}

Result<void> render_struct_like(const RenderContext& ctx, std::ostream& os)
{
    for (const char* name : {"fast_read", "fast_write", "blength"}) {
        if (auto result = ctx.templates->execute(name, ctx, os); !result) {
            return result;
        }
    }

    for (const char* name : {"field_read", "field_write", "field_length"}) {
        for (const auto& field : ctx.record->fields) {
            if (auto result = ctx.templates->execute(name, ctx.with_field(field), os); !result) {
                return result;
            }
        }
    }
    return {};
}

Result<void> render_fast_read(const RenderContext& ctx, std::ostream& os)
{
    const auto name = record_name(ctx);

    os << fmt::format("func (p *{}) FastRead(buf []byte) (int, error) {{\n", name);
    os << "\tvar err error\n"
          "\tvar offset int\n"
          "\tvar l int\n"
          "\tvar fieldTypeId thrift.TType\n"
          "\tvar fieldId int16\n";

    std::vector<FieldView> required;
    for (const auto& field : ctx.record->fields) {
        if (field.requiredness == ast::Requiredness::Required) {
            auto view = view_of(ctx, field);
            if (!view) {
                return std::unexpected(view.error());
            }
            os << fmt::format("\tvar isset{} bool = false\n", view->go_name);
            required.push_back(std::move(*view));
        }
    }

    os << "\t_, l, err = bthrift.Binary.ReadStructBegin(buf)\n"
          "\toffset += l\n"
          "\tif err != nil {\n"
          "\t\treturn offset, thrift.PrependError(fmt.Sprintf(\"%T read struct begin error: \", p), err)\n"
          "\t}\n\n"
          "\tfor {\n"
          "\t\t_, fieldTypeId, fieldId, l, err = bthrift.Binary.ReadFieldBegin(buf[offset:])\n"
          "\t\toffset += l\n"
          "\t\tif err != nil {\n"
          "\t\t\treturn offset, thrift.PrependError(fmt.Sprintf(\"%T read field begin error: \", p), err)\n"
          "\t\t}\n"
          "\t\tif fieldTypeId == thrift.STOP {\n"
          "\t\t\tbreak\n"
          "\t\t}\n"
          "\t\tswitch fieldId {\n";

    for (const auto& field : ctx.record->fields) {
        auto view = view_of(ctx, field);
        if (!view) {
            return std::unexpected(view.error());
        }
        os << fmt::format("\t\tcase {}:\n", field.id);
        os << fmt::format("\t\t\tif fieldTypeId == {} {{\n", view->wire_type);
        os << fmt::format("\t\t\t\tl, err = p.FastReadField{}(buf[offset:])\n", field.id);
        if (field.requiredness == ast::Requiredness::Required) {
            os << fmt::format("\t\t\t\tisset{} = err == nil\n", view->go_name);
        }
        os << "\t\t\t} else {\n"
              "\t\t\t\tl, err = bthrift.Binary.Skip(buf[offset:], fieldTypeId)\n"
              "\t\t\t}\n";
    }

    os << "\t\tdefault:\n"
          "\t\t\tl, err = bthrift.Binary.Skip(buf[offset:], fieldTypeId)\n"
          "\t\t}\n"
          "\t\toffset += l\n"
          "\t\tif err != nil {\n"
          "\t\t\treturn offset, thrift.PrependError(fmt.Sprintf(\"%T read field %d error: \", p, fieldId), err)\n"
          "\t\t}\n\n"
          "\t\tl, err = bthrift.Binary.ReadFieldEnd(buf[offset:])\n"
          "\t\toffset += l\n"
          "\t\tif err != nil {\n"
          "\t\t\treturn offset, thrift.PrependError(fmt.Sprintf(\"%T read field end error: \", p), err)\n"
          "\t\t}\n"
          "\t}\n"
          "\tl, err = bthrift.Binary.ReadStructEnd(buf[offset:])\n"
          "\toffset += l\n"
          "\tif err != nil {\n"
          "\t\treturn offset, thrift.PrependError(fmt.Sprintf(\"%T read struct end error: \", p), err)\n"
          "\t}\n";

    for (const auto& view : required) {
        os << fmt::format("\n\tif !isset{} {{\n", view.go_name);
        os << fmt::format("\t\treturn offset, thrift.NewTProtocolExceptionWithType(thrift.INVALID_DATA, "
                          "fmt.Errorf(\"required field {} is not set\"))\n",
                          view.go_name);
        os << "\t}\n";
    }

    os << "\treturn offset, nil\n"
          "}\n\n";
    return {};
}

Result<void> render_fast_write(const RenderContext& ctx, std::ostream& os)
{
    const auto name = record_name(ctx);

    auto ordered = ctx.funcs->reorder_struct_fields(ctx.record->fields);
    if (!ordered) {
        return std::unexpected(ordered.error());
    }

    os << fmt::format("func (p *{}) FastWrite(buf []byte) int {{\n", name)
       << "\treturn p.FastWriteNocopy(buf, nil)\n"
          "}\n\n";

    os << fmt::format("func (p *{}) FastWriteNocopy(buf []byte, binaryWriter bthrift.BinaryWriter) int {{\n", name)
       << "\toffset := 0\n"
       << fmt::format("\toffset += bthrift.Binary.WriteStructBegin(buf[offset:], \"{}\")\n", ctx.record->name)
       << "\tif p != nil {\n";
    for (const auto* field : *ordered) {
        os << fmt::format("\t\toffset += p.fastWriteField{}(buf[offset:], binaryWriter)\n", field->id);
    }
    os << "\t}\n"
          "\toffset += bthrift.Binary.WriteFieldStop(buf[offset:])\n"
          "\toffset += bthrift.Binary.WriteStructEnd(buf[offset:])\n"
          "\treturn offset\n"
          "}\n\n";
    return {};
}

Result<void> render_blength(const RenderContext& ctx, std::ostream& os)
{
    auto ordered = ctx.funcs->reorder_struct_fields(ctx.record->fields);
    if (!ordered) {
        return std::unexpected(ordered.error());
    }

    os << fmt::format("func (p *{}) BLength() int {{\n", record_name(ctx))
       << "\tl := 0\n"
       << fmt::format("\tl += bthrift.Binary.StructBeginLength(\"{}\")\n", ctx.record->name)
       << "\tif p != nil {\n";
    for (const auto* field : *ordered) {
        os << fmt::format("\t\tl += p.field{}Length()\n", field->id);
    }
    os << "\t}\n"
          "\tl += bthrift.Binary.FieldStopLength()\n"
          "\tl += bthrift.Binary.StructEndLength()\n"
          "\treturn l\n"
          "}\n\n";
    return {};
}

Result<void> render_field_read(const RenderContext& ctx, std::ostream& os)
{
    const auto& field = *ctx.field;
    auto view = view_of(ctx, field);
    if (!view) {
        return std::unexpected(view.error());
    }

    os << fmt::format("func (p *{}) FastReadField{}(buf []byte) (int, error) {{\n", record_name(ctx), field.id);
    os << "\toffset := 0\n\n";

    if (view->base != nullptr) {
        const auto type_id = type_id_of(view->base->kind);
        os << fmt::format("\tif v, l, err := bthrift.Binary.Read{}(buf[offset:]); err != nil {{\n", type_id)
           << "\t\treturn offset, err\n"
              "\t} else {\n"
              "\t\toffset += l\n"
           << fmt::format("\t\tvar _field {} = v\n", ctx.funcs->type_id_to_go_type(type_id))
           << fmt::format("\t\tp.{} = {}_field\n", view->go_name, view->is_pointer() ? "&" : "")
           << "\t}\n";
    } else if (view->is_struct()) {
        os << fmt::format("\tif p.{} == nil {{\n", view->go_name)
           << fmt::format("\t\tbthrift.Allocate(&p.{})\n", view->go_name) << "\t}\n"
           << fmt::format("\tl, err := p.{}.FastRead(buf[offset:])\n", view->go_name)
           << "\toffset += l\n"
              "\tif err != nil {\n"
              "\t\treturn offset, err\n"
              "\t}\n";
    } else {
        os << fmt::format("\tl, err := bthrift.Binary.ReadValue(buf[offset:], &p.{})\n", view->go_name)
           << "\toffset += l\n"
              "\tif err != nil {\n"
              "\t\treturn offset, err\n"
              "\t}\n";
    }

    os << "\treturn offset, nil\n"
          "}\n\n";
    return {};
}

std::string value_of(const FieldView& view)
{
    return (view.is_pointer() ? "*p." : "p.") + view.go_name;
}

Result<void> render_field_write(const RenderContext& ctx, std::ostream& os)
{
    const auto& field = *ctx.field;
    auto view = view_of(ctx, field);
    if (!view) {
        return std::unexpected(view.error());
    }

    os << fmt::format("func (p *{}) fastWriteField{}(buf []byte, binaryWriter bthrift.BinaryWriter) int {{\n",
                      record_name(ctx), field.id)
       << "\toffset := 0\n";

    std::string indent = "\t";
    if (view->optional) {
        os << fmt::format("\tif p.IsSet{}() {{\n", view->go_name);
        indent = "\t\t";
    }

    os << indent
       << fmt::format("offset += bthrift.Binary.WriteFieldBegin(buf[offset:], \"{}\", {}, {})\n", field.name,
                      view->wire_type, field.id);
    os << indent;
    if (view->base != nullptr && view->binary_or_string) {
        os << fmt::format("offset += bthrift.Binary.Write{}Nocopy(buf[offset:], binaryWriter, {})\n",
                          type_id_of(view->base->kind), value_of(*view));
    } else if (view->base != nullptr) {
        os << fmt::format("offset += bthrift.Binary.Write{}(buf[offset:], {})\n", type_id_of(view->base->kind),
                          value_of(*view));
    } else if (view->is_struct()) {
        os << fmt::format("offset += p.{}.FastWriteNocopy(buf[offset:], binaryWriter)\n", view->go_name);
    } else if (view->binary_or_string) {
        os << fmt::format("offset += bthrift.Binary.WriteValueNocopy(buf[offset:], binaryWriter, p.{})\n",
                          view->go_name);
    } else {
        os << fmt::format("offset += bthrift.Binary.WriteValue(buf[offset:], p.{})\n", view->go_name);
    }
    os << indent << "offset += bthrift.Binary.WriteFieldEnd(buf[offset:])\n";

    if (view->optional) {
        os << "\t}\n";
    }
    os << "\treturn offset\n"
          "}\n\n";
    return {};
}

Result<void> render_field_length(const RenderContext& ctx, std::ostream& os)
{
    const auto& field = *ctx.field;
    auto view = view_of(ctx, field);
    if (!view) {
        return std::unexpected(view.error());
    }

    os << fmt::format("func (p *{}) field{}Length() int {{\n", record_name(ctx), field.id) << "\tl := 0\n";

    std::string indent = "\t";
    if (view->optional) {
        os << fmt::format("\tif p.IsSet{}() {{\n", view->go_name);
        indent = "\t\t";
    }

    os << indent
       << fmt::format("l += bthrift.Binary.FieldBeginLength(\"{}\", {}, {})\n", field.name, view->wire_type,
                      field.id);
    os << indent;
    if (view->base != nullptr && view->binary_or_string) {
        os << fmt::format("l += bthrift.Binary.{}LengthNocopy({})\n", type_id_of(view->base->kind),
                          value_of(*view));
    } else if (view->base != nullptr) {
        os << fmt::format("l += bthrift.Binary.{}Length({})\n", type_id_of(view->base->kind), value_of(*view));
    } else if (view->is_struct()) {
        os << fmt::format("l += p.{}.BLength()\n", view->go_name);
    } else {
        os << fmt::format("l += bthrift.Binary.ValueLength(p.{})\n", view->go_name);
    }
    os << indent << "l += bthrift.Binary.FieldEndLength()\n";

    if (view->optional) {
        os << "\t}\n";
    }
    os << "\treturn l\n"
          "}\n\n";
    return {};
}

void render_accessor(std::ostream& os, const std::string& record, const std::string& field)
{
    os << fmt::format("func (p *{}) GetOrSet{}() interface{{}} {{\n", record, field)
       << fmt::format("\tif p.{} == nil {{\n", field) << fmt::format("\t\tbthrift.Allocate(&p.{})\n", field)
       << "\t}\n"
       << fmt::format("\treturn p.{}\n", field) << "}\n\n";
}

Result<void> render_envelope(const RenderContext& ctx, std::ostream& os)
{
    const auto match = ctx.funcs->filter_base(ctx.data->ast->document);
    for (const auto* record : match.requests) {
        render_accessor(os, ctx.funcs->go_name(record->name), "Base");
    }
    for (const auto* record : match.responses) {
        render_accessor(os, ctx.funcs->go_name(record->name), "BaseResp");
    }
    return {};
}

}  // namespace

TemplateSet build_templates()
{
    TemplateSet templates;
    templates.define("file", render_file);
    templates.define("imports", render_imports);
    templates.define("unused_protection", render_unused_protection);
    templates.define("struct_like", render_struct_like);
    templates.define("fast_read", render_fast_read);
    templates.define("fast_write", render_fast_write);
    templates.define("blength", render_blength);
    templates.define("field_read", render_field_read);
    templates.define("field_write", render_field_write);
    templates.define("field_length", render_field_length);
    templates.define("envelope", render_envelope);
    return templates;
}

}  // namespace kestrel::codegen::golang
