#pragma once

// minizip-ng
#include <minizip-ng/mz.h>
#include <minizip-ng/mz_zip.h>
#include <minizip-ng/mz_zip_rw.h>
#include <minizip-ng/mz_strm.h>
#include <minizip-ng/mz_strm_mem.h>

#include <cstdint>
#include <cstring>
#include <ctime>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

// Minimal single-sheet SpreadsheetML workbook: inline string cells, one
// wrap-text style, no shared strings table.
class XlsxWriterMinizip {
public:
    using Row = std::vector<std::string>;

    static inline const std::string SHEET_NAME = "Clauses";

    struct Result {
        bool success;
        std::string message;
    };

    struct BytesResult {
        bool success;
        std::string message;
        std::vector<uint8_t> outputBytes; // valid if success==true
    };

    // ------------------------- File IO API -------------------------
    static Result Write(const std::vector<Row> &rows, const std::string &outputPath) {
        auto [success, message, outputBytes] = WriteBytes(rows);
        if (!success) return {false, message};

        std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
        if (!out) return {false, "Cannot open " + outputPath + " for writing."};

        out.write(reinterpret_cast<const char *>(outputBytes.data()),
                  static_cast<std::streamsize>(outputBytes.size()));
        if (!out) return {false, "Write failed: " + outputPath};

        return {true, "Wrote Excel: " + outputPath};
    }

    // ------------------------- In-memory ZIP (minizip-ng) -------------------------
    static BytesResult WriteBytes(const std::vector<Row> &rows) {
        const std::vector<std::pair<std::string, std::string> > parts = {
            {"[Content_Types].xml", CONTENT_TYPES_XML},
            {"_rels/.rels", ROOT_RELS_XML},
            {"xl/workbook.xml", workbookXml()},
            {"xl/_rels/workbook.xml.rels", WORKBOOK_RELS_XML},
            {"xl/worksheets/sheet1.xml", BuildSheetXml(rows)},
            {"xl/styles.xml", STYLES_XML},
        };

        void *outStream = mz_stream_mem_create();
        if (!outStream)
            return {false, "minizip: failed to create memory stream (output).", {}};

        mz_stream_mem_set_grow_size(outStream, 64 * 1024);

        if (int32_t rc_out_open = mz_stream_open(outStream, nullptr, MZ_OPEN_MODE_CREATE); rc_out_open != MZ_OK) {
            mz_stream_mem_delete(&outStream);
            return {false, "minizip: stream_open(CREATE) failed rc=" + std::to_string(rc_out_open), {}};
        }
        mz_stream_seek(outStream, 0, MZ_SEEK_SET);

        void *writer = mz_zip_writer_create();
        if (!writer) {
            mz_stream_close(outStream);
            mz_stream_mem_delete(&outStream);
            return {false, "minizip: failed to create zip writer.", {}};
        }

        if (int32_t rc_w_open = mz_zip_writer_open(writer, outStream, 0); rc_w_open != MZ_OK) {
            mz_zip_writer_delete(&writer);
            mz_stream_close(outStream);
            mz_stream_mem_delete(&outStream);
            return {false, "minizip: writer_open failed rc=" + std::to_string(rc_w_open), {}};
        }

        mz_zip_writer_set_compress_method(writer, MZ_COMPRESS_METHOD_DEFLATE);
        mz_zip_writer_set_compress_level(writer, MZ_COMPRESS_LEVEL_DEFAULT);

        std::string failure;
        const time_t now = std::time(nullptr);

        for (const auto &[name, content]: parts) {
            mz_zip_file file_info = {};
            file_info.filename = name.c_str();
            file_info.flag |= MZ_ZIP_FLAG_UTF8;
            file_info.modified_date = now;
            file_info.uncompressed_size = static_cast<int64_t>(content.size());
            file_info.compression_method = MZ_COMPRESS_METHOD_DEFLATE;

            const int32_t rc_add = mz_zip_writer_add_buffer(writer,
                                                            const_cast<char *>(content.data()),
                                                            static_cast<int32_t>(content.size()),
                                                            &file_info);
            if (rc_add != MZ_OK) {
                failure = "minizip: add_buffer(" + name + ") failed rc=" + std::to_string(rc_add);
                break;
            }
        }

        const int32_t rc_close = mz_zip_writer_close(writer);
        mz_zip_writer_delete(&writer);

        if (!failure.empty() || rc_close != MZ_OK) {
            mz_stream_close(outStream);
            mz_stream_mem_delete(&outStream);
            if (failure.empty())
                failure = "minizip: writer_close failed rc=" + std::to_string(rc_close);
            return {false, failure, {}};
        }

        const void *out_buf = nullptr;
        mz_stream_mem_get_buffer(outStream, &out_buf);

        int32_t out_len = 0;
        mz_stream_mem_get_buffer_length(outStream, &out_len);

        if (!out_buf || out_len <= 0) {
            mz_stream_close(outStream);
            mz_stream_mem_delete(&outStream);
            return {false, "Output ZIP buffer is empty (unexpected).", {}};
        }

        // Copy while the stream still owns the buffer.
        std::vector<uint8_t> outBytes(static_cast<size_t>(out_len));
        std::memcpy(outBytes.data(), out_buf, static_cast<size_t>(out_len));

        mz_stream_close(outStream);
        mz_stream_mem_delete(&outStream);

        return {true, "Packed " + std::to_string(rows.size()) + " row(s).", std::move(outBytes)};
    }

    // ------------------------- Sheet XML -------------------------

    // 0 -> "A", 25 -> "Z", 26 -> "AA"
    static std::string ColumnLetter(size_t index) {
        std::string result;
        while (true) {
            result.insert(result.begin(), static_cast<char>('A' + index % 26));
            if (index < 26)
                break;
            index = index / 26 - 1;
        }
        return result;
    }

    static std::string EscapeCellText(const std::string &value) {
        std::string out;
        out.reserve(value.size());
        for (const char c: value) {
            switch (c) {
                case '&': out += "&amp;";
                    break;
                case '<': out += "&lt;";
                    break;
                case '>': out += "&gt;";
                    break;
                case '\n': out += "&#10;";
                    break;
                default: out.push_back(c);
            }
        }
        return out;
    }

    static std::string BuildSheetXml(const std::vector<Row> &rows) {
        std::string xml =
                "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">\n"
                "  <sheetData>\n";

        for (size_t r = 0; r < rows.size(); ++r) {
            const std::string rowRef = std::to_string(r + 1);
            xml += "    <row r=\"" + rowRef + "\">\n";
            for (size_t c = 0; c < rows[r].size(); ++c) {
                const std::string cellRef = ColumnLetter(c) + rowRef;
                const std::string &value = rows[r][c];
                if (value.empty()) {
                    xml += "      <c r=\"" + cellRef + "\"/>\n";
                    continue;
                }
                xml += "      <c r=\"" + cellRef + "\" t=\"inlineStr\"><is><t xml:space=\"preserve\">" +
                        EscapeCellText(value) + "</t></is></c>\n";
            }
            xml += "    </row>\n";
        }

        xml += "  </sheetData>\n</worksheet>";
        return xml;
    }

private:
    static std::string workbookXml() {
        return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
               "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
               "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">\n"
               "  <sheets>\n"
               "    <sheet name=\"" + SHEET_NAME + "\" sheetId=\"1\" r:id=\"rId1\"/>\n"
               "  </sheets>\n"
               "</workbook>";
    }

    static inline const std::string WORKBOOK_RELS_XML =
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">\n"
            "  <Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" Target=\"worksheets/sheet1.xml\"/>\n"
            "  <Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>\n"
            "</Relationships>";

    static inline const std::string ROOT_RELS_XML =
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">\n"
            "  <Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"xl/workbook.xml\"/>\n"
            "</Relationships>";

    static inline const std::string STYLES_XML =
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<styleSheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">\n"
            "  <fonts count=\"1\"><font><name val=\"Calibri\"/><family val=\"2\"/><sz val=\"11\"/></font></fonts>\n"
            "  <fills count=\"1\"><fill><patternFill patternType=\"none\"/></fill></fills>\n"
            "  <borders count=\"1\"><border/></borders>\n"
            "  <cellStyleXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\"/></cellStyleXfs>\n"
            "  <cellXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\" xfId=\"0\" applyAlignment=\"1\"><alignment wrapText=\"1\"/></xf></cellXfs>\n"
            "  <cellStyles count=\"1\"><cellStyle name=\"Normal\" xfId=\"0\" builtinId=\"0\"/></cellStyles>\n"
            "</styleSheet>";

    static inline const std::string CONTENT_TYPES_XML =
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">\n"
            "  <Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>\n"
            "  <Default Extension=\"xml\" ContentType=\"application/xml\"/>\n"
            "  <Override PartName=\"/xl/workbook.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>\n"
            "  <Override PartName=\"/xl/worksheets/sheet1.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>\n"
            "  <Override PartName=\"/xl/styles.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml\"/>\n"
            "</Types>";
};
