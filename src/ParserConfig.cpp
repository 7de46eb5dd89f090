#include "ParserConfig.hpp"
#include "ClauseLogging.hpp"
#include "NoiseFilter.hpp"

#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <QVariant>

#include <stdexcept>
#include <string>

namespace clausetree {
    const std::vector<std::string> &DefaultBoilerplatePatterns() {
        static const std::vector<std::string> patterns = {
            R"(^copyright british standards institution)",
            R"(^provided by accuris)",
            R"(^licensee=)",
            R"(^not for resale)",
            R"(^no reproduction or networking permitted)",
            R"(^bs en )",
            R"(^iec 61513)",
            R"(^61513)",
            R"(^raising standards worldwide)",
            "^\xE2\x80\x93\\s*\\d+\\s*\xE2\x80\x93", // "– 12 –"
            R"(--[`',.\-]{5,})"
        };
        return patterns;
    }

    ParserConfig DefaultParserConfig() {
        ParserConfig config;
        config.boilerplatePatterns = DefaultBoilerplatePatterns();
        return config;
    }

    ParserConfig LoadParserConfig(const std::string &iniPath) {
        const QString path = QString::fromStdString(iniPath);
        if (const QFileInfo fi(path); !fi.exists() || !fi.isReadable())
            throw std::runtime_error("Config file not readable: " + iniPath);

        QSettings settings(path, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError)
            throw std::runtime_error("Config file malformed: " + iniPath);

        ParserConfig config = DefaultParserConfig();

        config.fragmentMergeGap =
                settings.value("layout/fragmentMergeGap", config.fragmentMergeGap).toDouble();
        config.paragraphGap =
                settings.value("layout/paragraphGap", config.paragraphGap).toDouble();
        config.headingMinFontSize =
                settings.value("headings/minFontSize", config.headingMinFontSize).toDouble();
        config.headingMinBoldRatio =
                settings.value("headings/minBoldRatio", config.headingMinBoldRatio).toDouble();
        config.fragmentMinWords =
                settings.value("fragments/minWords", config.fragmentMinWords).toInt();
        config.fragmentMaxWords =
                settings.value("fragments/maxWords", config.fragmentMaxWords).toInt();

        // One pattern per array entry. A value holding a comma or backslash
        // must be quoted with backslashes doubled, as QSettings writes it.
        if (const int count = settings.beginReadArray("boilerplate"); count > 0) {
            config.boilerplatePatterns.clear();
            for (int i = 0; i < count; ++i) {
                settings.setArrayIndex(i);
                const QVariant value = settings.value("pattern");
                if (value.typeId() == QMetaType::QStringList)
                    throw std::runtime_error("Boilerplate pattern " + std::to_string(i + 1) +
                                             " in " + iniPath + " contains an unquoted comma");

                if (const QString p = value.toString(); !p.trimmed().isEmpty())
                    config.boilerplatePatterns.push_back(p.toStdString());
            }
        }
        settings.endArray();

        try {
            const NoiseFilter check(config);
        } catch (const std::invalid_argument &ex) {
            throw std::runtime_error(std::string(ex.what()) + " (" + iniPath + ")");
        }

        qCInfo(lcPipeline) << "Loaded parser config from" << path
                           << "with" << config.boilerplatePatterns.size() << "boilerplate pattern(s)";
        return config;
    }
} // namespace clausetree
