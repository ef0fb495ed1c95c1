//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/ToolchainContract.hpp
// Purpose: Fixed text and paths shared with `cargo web` and the Screeps host.
// Key invariants: The templates mirror the loader emitted by `cargo web build`;
//                 the invocation snippet calls __initialize(module, false).
// Ownership/Lifetime: Static storage; all values are immutable.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace screeps::build::contract
{

/// Sentinel inside a template that stands for an identifier chosen by the toolchain.
inline constexpr std::string_view kPlaceholder = "XXX";

/// Function defined by the stdweb runtime inside the generated loader.
/// Signature: function __initialize( __wasm_module, __load_asynchronously ).
inline constexpr std::string_view kEntryPointMarker = "__initialize";

/// Expected start of the loader generated by `cargo web`.
inline constexpr std::string_view kLoaderPrefixTemplate = R"JS("use strict";

if( typeof Rust === "undefined" ) {
    var Rust = {};
}

(function( root, factory ) {
    if( typeof define === "function" && define.amd ) {
        define( [], factory );
    } else if( typeof module === "object" && module.exports ) {
        module.exports = factory();
    } else {
        Rust.XXX = factory();
    }
}( this, function() {
    )JS";

/// Expected end of the loader: node/browser detection and the async fetch path.
inline constexpr std::string_view kLoaderSuffixTemplate = R"JS(


    if( typeof window === "undefined" ) {
        const fs = require( "fs" );
        const path = require( "path" );
        const wasm_path = path.join( __dirname, "XXX.wasm" );
        const buffer = fs.readFileSync( wasm_path );
        const mod = new WebAssembly.Module( buffer );

        return __initialize( mod, false );
    } else {
        return fetch( "XXX.wasm" )
            .then( response => response.arrayBuffer() )
            .then( bytes => WebAssembly.compile( bytes ) )
            .then( mod => __initialize( mod, true ) );
    }
}));
)JS";

/// Appended after the extracted payload. The Screeps host hands the module
/// over synchronously through require('compiled'), so loading is never async.
inline constexpr std::string_view kInitializeCall =
    "\n\n__initialize(new WebAssembly.Module(require('compiled')), false);\n";

/// Extension of the compiled binary module.
inline constexpr std::string_view kBinaryModuleExtension = ".wasm";

/// Extension of the generated loader script.
inline constexpr std::string_view kLoaderScriptExtension = ".js";

/// Target triple passed to cargo.
inline constexpr std::string_view kTargetTriple = "wasm32-unknown-unknown";

/// Directory under the project root that holds cargo output and our outputs.
inline constexpr std::string_view kTargetDir = "target";

/// Output name of the copied binary module.
inline constexpr std::string_view kOutputBinaryName = "compiled.wasm";

/// Output name of the assembled loader.
inline constexpr std::string_view kOutputScriptName = "main.js";

} // namespace screeps::build::contract
