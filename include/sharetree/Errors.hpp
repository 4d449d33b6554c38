/**
 * @file Errors.hpp
 * @brief Exception types for sharetree
 *
 * The merge engine itself never throws; these cover the surfaces around it:
 * - TreeError: Base class
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into (or access of) the wrong kind of value
 * - CycleError: Rendering a self-referential tree
 * - FileNotFoundError: Document file not found
 * - ParseError: JSON/TOML syntax errors
 * - UnsupportedFormatError: Unknown document file extension
 */

#ifndef SHARETREE_ERRORS_HPP
#define SHARETREE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace sharetree {

/**
 * @brief Base class for all sharetree exceptions
 */
class TreeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public TreeError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "database.host")
     * @param segment The specific segment that doesn't exist (e.g., "host")
     */
    KeyError(std::string path, std::string segment)
        : TreeError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Value of the wrong type
 *
 * Raised when traversing into a leaf (e.g. "scalar_value.sub_key"), when
 * a Value accessor is used on another alternative, or when a rendering
 * needs a specific root kind.
 */
class TypeError : public TreeError {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Dot-path of the offending value ("" for the root)
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : TreeError("Expected " + expected + " but found " + actual +
                    " at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A node was reached again below itself while rendering
 */
class CycleError : public TreeError {
public:
    /**
     * @param path Dot-path at which the repeated node was found
     */
    explicit CycleError(std::string path)
        : TreeError("Cyclic reference at path '" + path + "'")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public TreeError {
public:
    explicit FileNotFoundError(std::string path)
        : TreeError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 *
 * Line and column are 0 when the parser does not report them.
 */
class ParseError : public TreeError {
public:
    ParseError(std::string file, int line, int column, std::string details)
        : TreeError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) {
                msg += ", column " + std::to_string(column);
            }
        }
        return msg + ": " + details;
    }
};

/**
 * @brief File extension is neither .json nor .toml
 */
class UnsupportedFormatError : public TreeError {
public:
    UnsupportedFormatError(std::string path, std::string extension)
        : TreeError("Unsupported document type '" + extension + "' for " + path +
                    " (expected .json or .toml)")
        , path_(std::move(path))
        , extension_(std::move(extension))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string path_;
    std::string extension_;
};

} // namespace sharetree

#endif // SHARETREE_ERRORS_HPP
