#pragma once

#include <string>
#include <vector>

namespace clausetree {
    // Tuning values shared read-only by every pipeline stage.
    // The gap constants are empirical; keep them configurable.
    struct ParserConfig {
        double fragmentMergeGap = 1.5;
        double headingMinFontSize = 14.0;
        double headingMinBoldRatio = 0.5;
        double paragraphGap = 18.0;
        int fragmentMinWords = 2;
        int fragmentMaxWords = 6;

        // Case-insensitive, searched (not anchored unless the pattern says so).
        std::vector<std::string> boilerplatePatterns;
    };

    // Boilerplate seen on BSI / IEC standards: copyright and licensing stamps,
    // repeated standard numbers, "– N –" page banners, separator runs.
    const std::vector<std::string> &DefaultBoilerplatePatterns();

    ParserConfig DefaultParserConfig();

    // Reads an INI file through QSettings; missing keys keep their defaults.
    // Boilerplate patterns come from the [boilerplate] array (size, N\pattern).
    // Throws std::runtime_error when the file is absent or unreadable, or when
    // a pattern is split by an unquoted comma or fails to compile.
    ParserConfig LoadParserConfig(const std::string &iniPath);
} // namespace clausetree
