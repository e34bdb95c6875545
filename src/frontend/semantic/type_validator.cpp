#include "type_validator.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/static_visitor.hpp>

namespace kestrel::frontend::semantic {

void TypeValidator::validate(const ast::Type& type, const SourceFile& file, const ast::PositionTaggedNode& anchor,
                             const std::string& usage)
{
    struct Visitor : boost::static_visitor<void> {
        Visitor(TypeValidator& self, Context& context, const SourceFile& file,
                const ast::PositionTaggedNode& anchor, const std::string& usage)
            : self(self)
            , context(context)
            , file(file)
            , anchor(anchor)
            , usage(usage)
        {
        }

        TypeValidator& self;
        Context& context;
        const SourceFile& file;
        const ast::PositionTaggedNode& anchor;
        const std::string& usage;

        void operator()(const ast::BaseType&) const {}

        void operator()(const ast::UserType& user) const
        {
            (void)context.resolve_user_type(user, file, usage);
        }

        void operator()(const ast::ListType& list) const
        {
            self.validate(list.element, file, anchor, usage + " (list element)");
        }

        void operator()(const ast::SetType& set) const
        {
            self.validate_key(set.element, file, anchor, usage + " (set element)");
            self.validate(set.element, file, anchor, usage + " (set element)");
        }

        void operator()(const ast::MapType& map) const
        {
            self.validate_key(map.key, file, anchor, usage + " (map key)");
            self.validate(map.key, file, anchor, usage + " (map key)");
            self.validate(map.value, file, anchor, usage + " (map value)");
        }
    };

    boost::apply_visitor(Visitor(*this, context_, file, anchor, usage), type);
}

// Go cannot use slices or maps as map keys, and sets are generated as slices.
void TypeValidator::validate_key(const ast::Type& key, const SourceFile& file,
                                 const ast::PositionTaggedNode& anchor, const std::string& usage)
{
    if (boost::get<ast::BaseType>(&key) || boost::get<ast::UserType>(&key)) {
        return;
    }
    context_.report_warning(file, anchor, "Container type used as key in " + usage);
}

}  // namespace kestrel::frontend::semantic
