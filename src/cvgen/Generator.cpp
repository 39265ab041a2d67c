#include "cvgen/Generator.hpp"

#include "cvgen/Assembler.hpp"
#include "cvgen/DocxWriter.hpp"
#include "cvgen/StyleRegistry.hpp"

namespace cvgen {

GenerateResult generate_document(const ResumeRecord& record,
                                 const RenderConfig& cfg,
                                 const std::filesystem::path& out_path,
                                 DocumentConverter* converter) {
    const DocumentTree tree = assemble(record, StyleRegistry::standard(), cfg);
    serialize(tree, out_path);

    GenerateResult res;
    res.document_path = out_path;

    if (converter) {
        res.conversion = converter->convert(out_path, cfg.converter.format);
    }
    return res;
}

}  // namespace cvgen
