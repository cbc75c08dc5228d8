#include "dump.hpp"
#include "accessFlags.hpp"
#include "classfile.hpp"
#include "errors.hpp"
#include <string.h>



namespace classdec {



namespace {



class Printer {
public:
    Printer(std::ostream& out, const ConstantPool& constants)
        : out_(out), constants_(constants)
    {
    }


    void classfile(const ClassFile& cf)
    {
        out_ << "class " << ref(cf.this_class_);
        line() << "magic: " << hex(cf.magic_);
        line() << "version: " << cf.major_version_ << '.' << cf.minor_version_;

        line() << "constant pool (" << constants_.size() << " entries):";
        indent_ += 1;
        for (u16 i = 1; i < constants_.size(); ++i) {
            constant(i);
        }
        indent_ -= 1;

        line() << "access flags: " << flags(cf.access_flags_, FlagsOwner::class_);
        line() << "this class: " << ref(cf.this_class_);
        line() << "super class: " << ref(cf.super_class_);

        line() << "interfaces (" << cf.interfaces_.size() << "):";
        indent_ += 1;
        for (auto index : cf.interfaces_) {
            line() << ref(index);
        }
        indent_ -= 1;

        line() << "fields (" << cf.fields_.size() << "):";
        indent_ += 1;
        for (auto& field : cf.fields_) {
            member(field, FlagsOwner::field);
        }
        indent_ -= 1;

        line() << "methods (" << cf.methods_.size() << "):";
        indent_ += 1;
        for (auto& method : cf.methods_) {
            member(method, FlagsOwner::method);
        }
        indent_ -= 1;

        attributes(cf.attributes_);
    }


private:
    std::ostream& line()
    {
        out_ << '\n';
        for (int i = 0; i < indent_; ++i) {
            out_ << "  ";
        }
        return out_;
    }


    static std::string flags(u16 value, FlagsOwner owner)
    {
        auto names = access_flags_string(value, owner);
        if (names.empty()) {
            return hex(value);
        }
        return hex(value) + " (" + names + ")";
    }


    // The text behind an index, or an empty string if there isn't any.
    std::string text(u16 index, int depth = 0) const
    {
        if (depth > 2) {
            return "";
        }

        if (auto utf8 = constants_.find<ConstantUtf8>(index)) {
            return utf8->text_;
        } else if (auto clz = constants_.find<ConstantClass>(index)) {
            return text(clz->name_index_, depth + 1);
        } else if (auto str = constants_.find<ConstantString>(index)) {
            return "\"" + text(str->string_index_, depth + 1) + "\"";
        } else if (auto nt = constants_.find<ConstantNameAndType>(index)) {
            return text(nt->name_index_, depth + 1) + ":" +
                   text(nt->descriptor_index_, depth + 1);
        } else if (auto mt = constants_.find<ConstantMethodType>(index)) {
            return text(mt->descriptor_index_, depth + 1);
        } else if (auto mod = constants_.find<ConstantModule>(index)) {
            return text(mod->name_index_, depth + 1);
        } else if (auto package = constants_.find<ConstantPackage>(index)) {
            return text(package->name_index_, depth + 1);
        } else if (auto field = constants_.find<ConstantFieldRef>(index)) {
            return member_ref(*field, depth);
        } else if (auto method = constants_.find<ConstantMethodRef>(index)) {
            return member_ref(*method, depth);
        } else if (auto imethod =
                       constants_.find<ConstantInterfaceMethodRef>(index)) {
            return member_ref(*imethod, depth);
        }
        return "";
    }


    std::string member_ref(const ConstantRef& r, int depth) const
    {
        return text(r.class_index_, depth + 1) + "." +
               text(r.name_and_type_index_, depth + 1);
    }


    std::string ref(u16 index) const
    {
        auto result = "#" + std::to_string(index);
        auto resolved = text(index);
        if (not resolved.empty()) {
            result += " // " + resolved;
        }
        return result;
    }


    void constant(u16 index)
    {
        auto& c = constants_[index];

        auto& out = line() << '#' << index << ' '
                           << constant_type_name(constant_tag(c));

        std::visit([&](const auto& entry) { constant_body(out, entry); }, c);
    }


    void constant_body(std::ostream&, const ConstantUnusable&)
    {
    }


    void constant_body(std::ostream& out, const ConstantUtf8& c)
    {
        out << " \"" << c.text_ << '"';
    }


    static u32 to_u32(const std::array<u8, 4>& bytes)
    {
        return (u32(bytes[0]) << 24) | (u32(bytes[1]) << 16) |
               (u32(bytes[2]) << 8) | u32(bytes[3]);
    }


    void constant_body(std::ostream& out, const ConstantInteger& c)
    {
        out << ' ' << static_cast<s32>(to_u32(c.bytes_));
    }


    void constant_body(std::ostream& out, const ConstantFloat& c)
    {
        const u32 bits = to_u32(c.bytes_);
        float value;
        memcpy(&value, &bits, sizeof value);
        out << ' ' << value;
    }


    void constant_body(std::ostream& out, const ConstantLong& c)
    {
        const u64 bits = (u64(c.high_bytes_) << 32) | c.low_bytes_;
        out << ' ' << static_cast<s64>(bits);
    }


    void constant_body(std::ostream& out, const ConstantDouble& c)
    {
        const u64 bits = (u64(c.high_bytes_) << 32) | c.low_bytes_;
        double value;
        memcpy(&value, &bits, sizeof value);
        out << ' ' << value;
    }


    void constant_body(std::ostream& out, const ConstantClass& c)
    {
        out << ' ' << ref(c.name_index_);
    }


    void constant_body(std::ostream& out, const ConstantString& c)
    {
        out << ' ' << ref(c.string_index_);
    }


    void constant_body(std::ostream& out, const ConstantRef& c)
    {
        out << " #" << c.class_index_ << ".#" << c.name_and_type_index_;
        auto resolved = member_ref(c, 0);
        out << " // " << resolved;
    }


    void constant_body(std::ostream& out, const ConstantNameAndType& c)
    {
        out << " #" << c.name_index_ << ":#" << c.descriptor_index_ << " // "
            << text(c.name_index_) << ':' << text(c.descriptor_index_);
    }


    void constant_body(std::ostream& out, const ConstantMethodHandle& c)
    {
        out << " kind " << int(c.reference_kind_) << ' '
            << ref(c.reference_index_);
    }


    void constant_body(std::ostream& out, const ConstantMethodType& c)
    {
        out << ' ' << ref(c.descriptor_index_);
    }


    void constant_body(std::ostream& out, const ConstantDynamic& c)
    {
        out << " bootstrap " << c.bootstrap_method_attr_index_ << ' '
            << ref(c.name_and_type_index_);
    }


    void constant_body(std::ostream& out, const ConstantInvokeDynamic& c)
    {
        out << " bootstrap " << c.bootstrap_method_attr_index_ << ' '
            << ref(c.name_and_type_index_);
    }


    void constant_body(std::ostream& out, const ConstantModule& c)
    {
        out << ' ' << ref(c.name_index_);
    }


    void constant_body(std::ostream& out, const ConstantPackage& c)
    {
        out << ' ' << ref(c.name_index_);
    }


    template <typename T> void member(const T& m, FlagsOwner owner)
    {
        line() << ref(m.name_index_) << ' ' << ref(m.descriptor_index_);
        indent_ += 1;
        line() << "access flags: " << flags(m.access_flags_, owner);
        attributes(m.attributes_);
        indent_ -= 1;
    }


    void attributes(const Attributes& attrs)
    {
        line() << "attributes (" << attrs.size() << "):";
        indent_ += 1;
        for (auto& attr : attrs) {
            line() << attr.name() << " (" << attr.attribute_length_
                   << " bytes)";
            indent_ += 1;
            std::visit([this](const auto& info) { attribute(info); },
                       attr.info_);
            indent_ -= 1;
        }
        indent_ -= 1;
    }


    void index_list(const char* label, const std::vector<u16>& indices)
    {
        line() << label << " (" << indices.size() << "):";
        indent_ += 1;
        for (auto index : indices) {
            line() << ref(index);
        }
        indent_ -= 1;
    }


    void attribute(const AttributeConstantValue& a)
    {
        line() << "value: " << ref(a.constantvalue_index_);
    }


    void attribute(const AttributeCode& a)
    {
        line() << "max stack: " << a.max_stack_ << ", max locals: "
               << a.max_locals_ << ", code length: " << a.code_.size();

        line() << "exception table (" << a.exception_table_.size() << "):";
        indent_ += 1;
        for (auto& e : a.exception_table_) {
            line() << "start " << e.start_pc_ << ", end " << e.end_pc_
                   << ", handler " << e.handler_pc_ << ", catch "
                   << (e.catch_type_ ? ref(e.catch_type_) : "any");
        }
        indent_ -= 1;

        attributes(a.attributes_);
    }


    void verification_type(std::ostream& out, const VerificationType& v)
    {
        out << ' ' << verification_type_name(v.tag_);
        if (v.tag_ == VerificationType::t_object) {
            out << '(' << ref(v.cpool_index_) << ')';
        } else if (v.tag_ == VerificationType::t_uninitialized) {
            out << '(' << v.offset_ << ')';
        }
    }


    void verification_types(const char* label,
                            const std::vector<VerificationType>& types)
    {
        auto& out = line() << label << ':';
        for (auto& v : types) {
            verification_type(out, v);
        }
    }


    void attribute(const AttributeStackMapTable& a)
    {
        for (auto& frame : a.entries_) {
            line() << "frame type " << int(frame_type(frame))
                   << ", offset delta " << offset_delta(frame);

            indent_ += 1;
            if (auto same = std::get_if<SameLocals1StackItemFrame>(&frame)) {
                verification_types("stack", {same->stack_});
            } else if (auto ext = std::get_if<SameLocals1StackItemFrameExtended>(
                           &frame)) {
                verification_types("stack", {ext->stack_});
            } else if (auto append = std::get_if<AppendFrame>(&frame)) {
                verification_types("locals", append->locals_);
            } else if (auto full = std::get_if<FullFrame>(&frame)) {
                verification_types("locals", full->locals_);
                verification_types("stack", full->stack_);
            }
            indent_ -= 1;
        }
    }


    void attribute(const AttributeExceptions& a)
    {
        index_list("exceptions", a.exception_index_table_);
    }


    void attribute(const AttributeInnerClasses& a)
    {
        for (auto& c : a.classes_) {
            line() << "inner " << ref(c.inner_class_info_index_);
            indent_ += 1;
            line() << "outer " << ref(c.outer_class_info_index_);
            line() << "name " << ref(c.inner_name_index_);
            line() << "access flags: "
                   << flags(c.inner_class_access_flags_,
                            FlagsOwner::inner_class);
            indent_ -= 1;
        }
    }


    void attribute(const AttributeEnclosingMethod& a)
    {
        line() << "class: " << ref(a.class_index_);
        line() << "method: " << ref(a.method_index_);
    }


    void attribute(const AttributeSynthetic&)
    {
    }


    void attribute(const AttributeSignature& a)
    {
        line() << "signature: " << ref(a.signature_index_);
    }


    void attribute(const AttributeSourceFile& a)
    {
        line() << "source file: " << ref(a.sourcefile_index_);
    }


    void attribute(const AttributeSourceDebugExtension& a)
    {
        line() << "debug extension: " << a.debug_extension_.size()
               << " bytes";
    }


    void attribute(const AttributeLineNumberTable& a)
    {
        for (auto& row : a.line_number_table_) {
            line() << "line " << row.line_number_ << ": " << row.start_pc_;
        }
    }


    void attribute(const AttributeLocalVariableTable& a)
    {
        for (auto& v : a.local_variable_table_) {
            line() << "slot " << v.index_ << ", start " << v.start_pc_
                   << ", length " << v.length_ << ' ' << ref(v.name_index_)
                   << ' ' << ref(v.descriptor_index_);
        }
    }


    void attribute(const AttributeLocalVariableTypeTable& a)
    {
        for (auto& v : a.local_variable_type_table_) {
            line() << "slot " << v.index_ << ", start " << v.start_pc_
                   << ", length " << v.length_ << ' ' << ref(v.name_index_)
                   << ' ' << ref(v.signature_index_);
        }
    }


    void attribute(const AttributeDeprecated&)
    {
    }


    void element_value(const ElementValue& value)
    {
        auto& out = line() << "tag '" << char(value.tag_) << "' ";

        if (auto c = std::get_if<ElementValue::ConstValue>(&value.value_)) {
            out << ref(c->const_value_index_);
        } else if (auto e = std::get_if<ElementValue::EnumConstValue>(
                       &value.value_)) {
            out << ref(e->type_name_index_) << ' '
                << ref(e->const_name_index_);
        } else if (auto cls =
                       std::get_if<ElementValue::ClassValue>(&value.value_)) {
            out << ref(cls->class_info_index_);
        } else if (auto nested = std::get_if<Annotation>(&value.value_)) {
            indent_ += 1;
            annotation(*nested);
            indent_ -= 1;
        } else if (auto array =
                       std::get_if<ElementValue::ArrayValue>(&value.value_)) {
            out << '(' << array->values_.size() << " values)";
            indent_ += 1;
            for (auto& v : array->values_) {
                element_value(v);
            }
            indent_ -= 1;
        }
    }


    void annotation(const Annotation& a)
    {
        line() << "annotation " << ref(a.type_index_);
        indent_ += 1;
        for (auto& pair : a.element_value_pairs_) {
            line() << ref(pair.element_name_index_) << " =";
            indent_ += 1;
            element_value(pair.value_);
            indent_ -= 1;
        }
        indent_ -= 1;
    }


    void attribute(const AttributeAnnotations& a)
    {
        for (auto& annot : a.annotations_) {
            annotation(annot);
        }
    }


    void attribute(const AttributeParameterAnnotations& a)
    {
        for (size_t i = 0; i < a.parameter_annotations_.size(); ++i) {
            line() << "parameter " << i << ':';
            indent_ += 1;
            for (auto& annot : a.parameter_annotations_[i]) {
                annotation(annot);
            }
            indent_ -= 1;
        }
    }


    void attribute(const AttributeTypeAnnotations& a)
    {
        for (auto& annot : a.annotations_) {
            auto& out = line() << "target type " << hex(annot.target_type_)
                               << ", path";
            for (auto& p : annot.target_path_) {
                out << " (" << int(p.type_path_kind_) << ", "
                    << int(p.type_argument_index_) << ')';
            }
            indent_ += 1;
            std::visit([this](const auto& info) { target_info(info); },
                       annot.target_info_);
            annotation(annot.annotation_);
            indent_ -= 1;
        }
    }


    void target_info(const TypeParameterTarget& t)
    {
        line() << "type parameter " << int(t.type_parameter_index_);
    }


    void target_info(const SupertypeTarget& t)
    {
        line() << "supertype " << t.supertype_index_;
    }


    void target_info(const TypeParameterBoundTarget& t)
    {
        line() << "type parameter " << int(t.type_parameter_index_)
               << ", bound " << int(t.bound_index_);
    }


    void target_info(const EmptyTarget&)
    {
    }


    void target_info(const FormalParameterTarget& t)
    {
        line() << "formal parameter " << int(t.formal_parameter_index_);
    }


    void target_info(const ThrowsTarget& t)
    {
        line() << "throws " << t.throws_type_index_;
    }


    void target_info(const LocalvarTarget& t)
    {
        for (auto& entry : t.table_) {
            line() << "local start_pc " << entry.start_pc_ << ", length "
                   << entry.length_ << ", index " << entry.index_;
        }
    }


    void target_info(const CatchTarget& t)
    {
        line() << "catch " << t.exception_table_index_;
    }


    void target_info(const OffsetTarget& t)
    {
        line() << "offset " << t.offset_;
    }


    void target_info(const TypeArgumentTarget& t)
    {
        line() << "offset " << t.offset_ << ", type argument "
               << int(t.type_argument_index_);
    }


    void attribute(const AttributeAnnotationDefault& a)
    {
        element_value(a.default_value_);
    }


    void attribute(const AttributeBootstrapMethods& a)
    {
        for (size_t i = 0; i < a.bootstrap_methods_.size(); ++i) {
            auto& method = a.bootstrap_methods_[i];
            line() << i << ": " << ref(method.bootstrap_method_ref_);
            indent_ += 1;
            index_list("arguments", method.bootstrap_arguments_);
            indent_ -= 1;
        }
    }


    void attribute(const AttributeMethodParameters& a)
    {
        for (auto& p : a.parameters_) {
            line() << ref(p.name_index_) << ' '
                   << flags(p.access_flags_, FlagsOwner::parameter);
        }
    }


    void attribute(const AttributeModule& a)
    {
        line() << "module: " << ref(a.module_name_index_) << ", flags "
               << flags(a.module_flags_, FlagsOwner::module) << ", version "
               << ref(a.module_version_index_);

        for (auto& r : a.requires_) {
            line() << "requires " << ref(r.requires_index_) << ", flags "
                   << flags(r.requires_flags_, FlagsOwner::module_requires)
                   << ", version " << ref(r.requires_version_index_);
        }

        for (auto& e : a.exports_) {
            line() << "exports " << ref(e.exports_index_) << ", flags "
                   << flags(e.exports_flags_, FlagsOwner::module_package);
            indent_ += 1;
            index_list("to", e.exports_to_index_);
            indent_ -= 1;
        }

        for (auto& o : a.opens_) {
            line() << "opens " << ref(o.opens_index_) << ", flags "
                   << flags(o.opens_flags_, FlagsOwner::module_package);
            indent_ += 1;
            index_list("to", o.opens_to_index_);
            indent_ -= 1;
        }

        index_list("uses", a.uses_index_);

        for (auto& p : a.provides_) {
            line() << "provides " << ref(p.provides_index_);
            indent_ += 1;
            index_list("with", p.provides_with_index_);
            indent_ -= 1;
        }
    }


    void attribute(const AttributeModulePackages& a)
    {
        index_list("packages", a.package_index_);
    }


    void attribute(const AttributeModuleMainClass& a)
    {
        line() << "main class: " << ref(a.main_class_index_);
    }


    void attribute(const AttributeNestHost& a)
    {
        line() << "host: " << ref(a.host_class_index_);
    }


    void attribute(const AttributeNestMembers& a)
    {
        index_list("members", a.classes_);
    }


    void attribute(const AttributeRecord& a)
    {
        for (auto& c : a.components_) {
            line() << "component " << ref(c.name_index_) << ' '
                   << ref(c.descriptor_index_);
            indent_ += 1;
            attributes(c.attributes_);
            indent_ -= 1;
        }
    }


    void attribute(const AttributePermittedSubclasses& a)
    {
        index_list("subclasses", a.classes_);
    }


    std::ostream& out_;
    const ConstantPool& constants_;
    int indent_ = 0;
};



} // namespace



void dump(std::ostream& out, const ClassFile& classfile)
{
    Printer printer(out, classfile.constants_);
    printer.classfile(classfile);
    out << '\n';
}



} // namespace classdec
