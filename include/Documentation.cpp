// ---- CODEC ----
// Codec Documentation
/*
DOCUMENTATION:
CLASS: Codec (abstract strategy)

METHODS:
  . Format format() const
      - Format the strategy writes
  . std::string encode(const Value& value) const
      - Serializes a value tree into raw file contents
      - Throws EncodeError if the value cannot be represented
  . Value decode(const std::string& bytes) const
      - Parses raw file contents back into a value tree
      - Throws DecodeError on malformed input

FREE FUNCTIONS:
  . const Codec& codec_for(Format format)
      - Returns the shared strategy for a format
  . Format select_format(const std::string& path)
      - Structured for a leaf ending in ".json", Opaque otherwise
      - Case-sensitive, never fails
  . std::string leaf_extension(const std::string& path)
      - Suffix after the final '.' of the leaf, empty if none
*/

// StructuredCodec Documentation
/*
DOCUMENTATION:
CLASS: StructuredCodec : Codec

VARIABLES:
. static constexpr int INDENT = 2
    - Indentation of the JSON text written to disk

METHODS:
Public:
  . std::string encode(const Value& value) const
      - Dumps the value as indented JSON text
      - Throws EncodeError for binary blobs, non-finite numbers and
        strings that are not valid UTF-8
  . Value decode(const std::string& bytes) const
      - Parses JSON text
      - Throws DecodeError on malformed or empty text

Private:
  . void check_representable(const Value& value, const std::string& location) const
      - Recursive walk, the error names the JSON pointer of the bad node
*/

// OpaqueCodec Documentation
/*
DOCUMENTATION:
CLASS: OpaqueCodec : Codec

METHODS:
  . std::string encode(const Value& value) const
      - Serializes the value as CBOR, binary blobs included
  . Value decode(const std::string& bytes) const
      - Parses a single CBOR item
      - Throws DecodeError on truncated, empty or trailing input
*/


// ---- CONFIG ----
// Platform Documentation
/*
DOCUMENTATION:
ENUM: Platform { Linux, MacOS, Windows }

FREE FUNCTIONS:
  . Platform current_platform()
      - Platform the binary was compiled for
  . std::string resolve_save_path(Platform platform, const std::string& project_title,
                                  const EnvLookup& env)
      - Linux:   $XDG_DATA_HOME/<title>/, else $HOME/.local/share/<title>/
      - macOS:   $HOME/Library/Application Support/<title>/
      - Windows: %APPDATA%/<title>/
      - Throws ConfigError for an empty title or missing variables
*/

// ProgramOptions Documentation
/*
DOCUMENTATION:
STRUCT: ProgramOptions

VARIABLES:
. std::string project_title
    - Required, names the save directory
. std::string root_override
    - Replaces the platform save directory when set
. Platform platform
. std::string log_file
. severity_level log_level
. bool valid

FREE FUNCTIONS:
  . ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err)
      - Prints usage on bad input and returns valid == false
  . std::string resolve_root(const ProgramOptions& options, const EnvLookup& env)
      - Override if present, platform save directory otherwise
*/


// ---- LOGGER ----
// Logging Documentation
/*
DOCUMENTATION:
NAMESPACE: savestore::logging

FUNCTIONS:
  . void init_logging(const std::string& log_file, severity_level min_level)
      - Replaces all sinks with a truncating, auto-flushing file sink
      - Format: "<timestamp> [<severity>] <message>"
  . void init_console_logging(severity_level min_level)
      - Replaces all sinks with a console sink
  . void set_log_level(severity_level min_level)
  . void enable_logging() / void disable_logging()
  . severity_level parse_severity(const std::string& name)
      - Throws ConfigError for unknown names
*/


// ---- STORE ----
// Store Documentation
/*
DOCUMENTATION:
CLASS: Store

VARIABLES:
. const std::string project_title_
    - Project the store belongs to
. const std::string root_path_
    - Absolute root directory, always ends with '/'
. DirectoryMaterializer materializer_
. TreeEnumerator enumerator_

CONSTRUCTOR:
. Store(const std::string& project_title, const std::string& root_path)
    - Normalizes the root to end with '/'
    - Creates the root directory if it doesn't exist
    - Throws IoError if directory creation fails

METHODS:
Public:
  Core Storage:
  . void write(const std::string& path, const Value& value)
      - Creates missing ancestor directories
      - Encodes with the codec selected by the path's extension
      - Writes, flushes and closes the file
      - Throws IoError or EncodeError, nothing is opened if encoding fails
  . Value read(const std::string& path) const
      - Throws NotFoundError naming the absolute path if nothing exists
      - Throws IoError for directories and read failures
      - Throws DecodeError if the contents do not parse

  Query Operations:
  . bool exists(const std::string& path) const
      - True for files and directories, false on any query failure
  . std::vector<std::string> list() const
      - Every stored file relative to the root, breadth-first

  Getters:
  . const std::string& project_title() const
  . const std::string& root_path() const

Private:
  . std::string resolve_path(const std::string& path) const
      - Concatenates the root and the relative path
  . void write_file(const std::string& absolute_path, const std::string& bytes) const
  . std::string read_file(const std::string& absolute_path) const
      - Reads in 4096 byte chunks
*/

// DirectoryMaterializer Documentation
/*
DOCUMENTATION:
CLASS: DirectoryMaterializer

VARIABLES:
. std::string root_

METHODS:
  . void ensure_directories(const std::string& path) const
      - Walks the directory segments root to leaf
      - Creates each missing level with a single non-recursive call
      - Throws IoError on the first failure, including a plain file
        occupying a directory segment
*/

// TreeEnumerator Documentation
/*
DOCUMENTATION:
CLASS: TreeEnumerator

VARIABLES:
. std::string root_

METHODS:
  . std::vector<std::string> enumerate() const
      - Breadth-first walk driven by a deque of pending directories
      - Regular files are reported, directories are queued,
        symlinks and special files are skipped
      - Returns an empty list for an absent root
      - Throws IoError if an existing directory cannot be read
*/

// Path Splitter Documentation
/*
DOCUMENTATION:
STRUCT: PathComponents
. std::vector<std::string> directories
. std::string leaf

FREE FUNCTIONS:
  . PathComponents split_path(const std::string& path)
      - Never fails, trailing separator gives an empty leaf
  . std::string join_path(const PathComponents& components)
      - Inverse of split_path
*/

// Store Errors Documentation
/*
DOCUMENTATION:
CLASS: StoreError : std::runtime_error
CLASS: NotFoundError : StoreError
    - "<absolute path>: No such file or directory"
CLASS: IoError : StoreError
    - Prefixed with "I/O error: "
CLASS: EncodeError : StoreError
    - Prefixed with "Encode error: "
CLASS: DecodeError : StoreError
    - Prefixed with "Decode error: "
*/


// ---- CLI ----
// CLI Documentation
/*
DOCUMENTATION:
CLASS: CLI

VARIABLES:
. bool running_
. Store& store_
. std::istream& in_
. std::ostream& out_

METHODS:
  . void run()
      - Prompts and processes commands until "quit" or end of input
      - Commands: read, write, exists, ls, pwd, help, quit
      - Failures are logged and printed, never thrown
*/
