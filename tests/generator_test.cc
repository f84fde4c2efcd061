// Sequential run: per-layer documents, index, and fatal error reporting
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <variant>

#include "test_support.hh"

using xapdoc::Config;
using xapdoc::ErrorKind;
using xapdoc::GenerateError;
using xapdoc::Generator;
using xapdoc::RunResult;
using xapdoc::RunSummary;
using xapdoc::internal::to_native_checked;
using xapdoc_test::contains;
using xapdoc_test::fail;
using xapdoc_test::MemorySink;
using xapdoc_test::MemorySource;

namespace fs = std::filesystem;

static const char* BASE_LAYER =
  "documentation:\n"
  "  order: [intro, \"!type_docs!\"]\n"
  "  intro: \"# Intro\\n\"\n"
  "type_docs:\n"
  "  u8: octet\n";

static const char* FLAGS_LAYER =
  "documentation:\n"
  "  order: [\"!response_flags!\"]\n"
  "type_docs:\n"
  "  u16: two octets\n"
  "response_flags:\n"
  "  bits:\n"
  "    \"3\": {name: ERR, description: error flag}\n";

// Sink whose second write fails inside the YAML library
class FailingSink : public xapdoc::DocumentSink {
public:
  void write( const std::string& filename, const std::string& ) override {
    if ( ++count_ == 2 ) throw fkyaml::exception( "node type mismatch" );
    written.push_back( filename );
  }

  std::vector< std::string > written;

private:
  int count_ = 0;
};

static std::string slurp( const fs::path& p ) {
  std::ifstream in( p );
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

int main() {
  // Two layers, only the second defines response flags
  {
    MemorySource source;
    source.add( "xap_0.0.1", BASE_LAYER );
    source.add( "xap_0.0.2", FLAGS_LAYER );
    MemorySink sink;
    Generator gen( Config(), source, sink );

    const RunResult result = gen.run();
    if ( !std::holds_alternative< RunSummary >(result) ) {
      return fail( "two_layers_ok",
        std::get< GenerateError >( result ).message );
    }
    const auto& summary = std::get< RunSummary >( result );
    if ( summary.documents.size() != 2 ) return fail( "two_layers_docs" );

    const std::string first = sink.files[ "xap_0.0.1.md" ];
    const std::string second = sink.files[ "xap_0.0.2.md" ];
    if ( first != "# Intro\n\n| Name | Definition |\n| -- | -- |\n"
      "| _u8_ | octet |\n\n" )
    {
      return fail( "first_document", first );
    }
    if ( contains(first, "Bit 3") ) return fail( "first_has_no_flags", first );
    if ( !contains(second, "| - | - | - | - | ERR | - | - | - |") ) {
      return fail( "second_has_flags", second );
    }
    // Cumulative: the type table now carries both layers' types
    if ( !contains(second, "| _u16_ | two octets |\n| _u8_ | octet |") ) {
      return fail( "second_cumulative_types", second );
    }

    const std::string index = sink.files[ "xap_protocol.md" ];
    if ( index != "# XAP Protocol Reference\n\n"
      "* [XAP Version 0.0.2](xap_0.0.2.md)\n"
      "* [XAP Version 0.0.1](xap_0.0.1.md)\n" )
    {
      return fail( "index", index );
    }
    if ( sink.writes.back() != "xap_protocol.md" ) return fail( "index_last" );

    // Default fill is visible in the final cumulative tree
    const auto& bits = summary.merged.at( "response_flags" ).at( "bits" );
    if ( bits.size() != 8 ) return fail( "merged_bits_filled" );
  }

  // Unknown section in order: fatal, nothing further written
  {
    MemorySource source;
    source.add( "xap_0.0.1", BASE_LAYER );
    source.add( "xap_0.0.2", "documentation:\n  order: [missing_part]\n" );
    source.add( "xap_0.0.3", "type_docs: {u32: four}\n" );
    MemorySink sink;
    Generator gen( Config(), source, sink );

    const RunResult result = gen.run();
    const auto* err = std::get_if< GenerateError >( &result );
    if ( err == nullptr ) return fail( "missing_section_fails" );
    if ( err->kind != ErrorKind::MissingSection ) {
      return fail( "missing_section_kind", err->message );
    }
    if ( err->layer != "xap_0.0.2" ) return fail( "missing_section_layer" );
    if ( !contains(err->dump, "missing_part") ) {
      return fail( "missing_section_dump", err->dump );
    }
    if ( !sink.has("xap_0.0.1.md") ) return fail( "earlier_doc_kept" );
    if ( sink.has("xap_0.0.2.md") || sink.has("xap_0.0.3.md")
      || sink.has("xap_protocol.md") )
    {
      return fail( "nothing_further_written" );
    }
  }

  // Parse failure of a later layer aborts before merging it
  {
    MemorySource source;
    source.add( "xap_0.0.1", BASE_LAYER );
    source.add( "xap_0.0.2", "- not\n- a mapping\n" );
    MemorySink sink;
    Generator gen( Config(), source, sink );

    const RunResult result = gen.run();
    const auto* err = std::get_if< GenerateError >( &result );
    if ( err == nullptr || err->kind != ErrorKind::InputParse ) {
      return fail( "parse_error_kind" );
    }
    if ( !sink.has("xap_0.0.1.md") || sink.has("xap_protocol.md") ) {
      return fail( "parse_error_outputs" );
    }
    if ( !contains(err->dump, "octet") ) {
      return fail( "parse_error_dump", err->dump );
    }
  }

  // Render failure carries the tree state
  {
    MemorySource source;
    source.add( "xap_0.0.1",
      "documentation: {order: []}\nresponse_flags: {bits: [1, 2]}\n" );
    MemorySink sink;
    Generator gen( Config(), source, sink );

    const RunResult result = gen.run();
    const auto* err = std::get_if< GenerateError >( &result );
    if ( err == nullptr || err->kind != ErrorKind::Render ) {
      return fail( "render_error_kind" );
    }
    if ( err->dump.empty() || !sink.files.empty() ) {
      return fail( "render_error_state" );
    }
  }

  // No layers: only the index, with no entries
  {
    MemorySource source;
    MemorySink sink;
    Generator gen( Config(), source, sink );
    const RunResult result = gen.run();
    if ( !std::holds_alternative< RunSummary >(result) ) {
      return fail( "no_layers_ok" );
    }
    if ( sink.files.size() != 1
      || sink.files[ "xap_protocol.md" ] != "# XAP Protocol Reference\n\n" )
    {
      return fail( "no_layers_index" );
    }
  }

  // Reset of the document order between layers
  {
    MemorySource source;
    source.add( "xap_0.0.1", BASE_LAYER );
    source.add( "xap_0.0.2",
      "documentation:\n  order: [\"!reset!\", intro]\n" );
    MemorySink sink;
    Generator gen( Config(), source, sink );
    if ( !std::holds_alternative< RunSummary >(gen.run()) ) {
      return fail( "order_reset_ok" );
    }
    if ( sink.files[ "xap_0.0.2.md" ] != "# Intro\n\n" ) {
      return fail( "order_reset_doc", sink.files["xap_0.0.2.md"] );
    }
  }

  // The merged tree and the failure dump both read back as the same tree,
  // reserved "!...!" keys and "-" placeholders included
  {
    MemorySource source;
    source.add( "xap_0.0.1", BASE_LAYER );
    source.add( "xap_0.0.2", FLAGS_LAYER );
    MemorySink sink;
    Generator gen( Config(), source, sink );
    const RunResult result = gen.run();
    if ( !std::holds_alternative< RunSummary >(result) ) {
      return fail( "merged_yaml_run" );
    }
    const auto& merged = std::get< RunSummary >( result ).merged;
    const std::string text = xapdoc::internal::to_yaml( merged );
    if ( xapdoc::ordered_node::deserialize(text) != merged ) {
      return fail( "merged_yaml_reads_back", text );
    }

    // write_merged: nothing when unset, a readable file when set
    Config cfg;
    if ( xapdoc::write_merged(cfg, std::get< RunSummary >(result)) ) {
      return fail( "write_merged_unset" );
    }
    const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path out = fs::temp_directory_path()
      / ( "xapdoc_merged_" + std::to_string(stamp) + ".yaml" );
    cfg.merged_output = out;
    if ( !xapdoc::write_merged(cfg, std::get< RunSummary >(result)) ) {
      return fail( "write_merged_set" );
    }
    const std::string written = slurp( out );
    std::error_code ec;
    fs::remove( out, ec );
    const auto reread = xapdoc::ordered_node::deserialize( written );
    if ( reread != merged ) return fail( "write_merged_reads_back", written );
    const auto& flags = reread.at( "documentation" ).at( "!response_flags!" );
    if ( !flags.is_string() ) return fail( "write_merged_reserved_key" );
    const auto& bit0 = reread.at( "response_flags" ).at( "bits" ).at( "0" );
    if ( to_native_checked< std::string >(bit0.at("name")) != "-" ) {
      return fail( "write_merged_placeholder", written );
    }

    // Failure dump after the same two layers
    MemorySource broken;
    broken.add( "xap_0.0.1", BASE_LAYER );
    broken.add( "xap_0.0.2", FLAGS_LAYER );
    broken.add( "xap_0.0.3", "documentation:\n  order: [missing_part]\n" );
    MemorySink broken_sink;
    Generator broken_gen( Config(), broken, broken_sink );
    const RunResult broken_result = broken_gen.run();
    const auto* err = std::get_if< GenerateError >( &broken_result );
    if ( err == nullptr ) return fail( "dump_run_fails" );
    const auto dumped = xapdoc::ordered_node::deserialize( err->dump );
    if ( !dumped.at("documentation").contains("!type_docs!") ) {
      return fail( "dump_reserved_key", err->dump );
    }
    const auto& bit7 = dumped.at( "response_flags" ).at( "bits" ).at( "7" );
    if ( to_native_checked< std::string >(bit7.at("name")) != "-" ) {
      return fail( "dump_placeholder", err->dump );
    }
  }

  // A YAML library exception mid-run becomes a typed error with a dump
  {
    MemorySource source;
    source.add( "xap_0.0.1", BASE_LAYER );
    source.add( "xap_0.0.2", FLAGS_LAYER );
    FailingSink sink;
    Generator gen( Config(), source, sink );
    const RunResult result = gen.run();
    const auto* err = std::get_if< GenerateError >( &result );
    if ( err == nullptr ) return fail( "library_error_caught" );
    if ( err->kind != ErrorKind::Structure ) {
      return fail( "library_error_kind", err->message );
    }
    if ( err->layer != "xap_0.0.2" ) return fail( "library_error_layer" );
    if ( err->dump.empty() || !contains(err->dump, "ERR") ) {
      return fail( "library_error_dump", err->dump );
    }
    if ( sink.written.size() != 1 ) return fail( "library_error_writes" );
  }

  std::printf( "generator_test: OK\n" );
  return 0;
}
