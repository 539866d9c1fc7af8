#ifndef PSA_FRONTEND_PYTHON_PARSER_H
#define PSA_FRONTEND_PYTHON_PARSER_H

#include "psa/core/result.h"
#include "psa/syntax/syntax_node.h"

#include <string>
#include <string_view>

namespace psa::frontend {

    /**
     * @class PythonParser
     * Parses Python source with tree-sitter and converts it into syntax nodes.
     *
     * A tree-sitter parser is created per call, so one instance may be used
     * from several threads at once.
     */
    class PythonParser {
    public:
        PythonParser() = default;

        /**
         * Parses Python source text.
         *
         * @param source Raw file bytes. A leading UTF-8 byte order mark is ignored.
         * @param path Used in error messages only.
         * @return The MODULE node, FILE_DECODE_ERROR for invalid UTF-8, or
         *         FILE_PARSE_ERROR if the tree contains ERROR or MISSING nodes.
         */
        [[nodiscard]] core::Result<syntax::NodePtr> parse(std::string_view source,
                                                          const std::string& path = "<memory>") const;

        /**
         * Reads and parses one file.
         *
         * @return As parse(), or FILE_READ_ERROR if the file cannot be read.
         */
        [[nodiscard]] core::Result<syntax::NodePtr> parse_file(const std::string& path) const;
    };

}

#endif //PSA_FRONTEND_PYTHON_PARSER_H
