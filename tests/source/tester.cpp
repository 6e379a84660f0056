// tester.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

int main(int argc, char** argv)
{
	// keep warnings about fallbacks and missing glyphs out of the test output
	folio::setLogLevel(argc > 1 && std::string_view(argv[1]) == "-v" ? folio::LogLevel::Debug : folio::LogLevel::Error);

	test::Context context {};

	const std::pair<const char*, void (*)(test::Context&)> suites[] = {
		{ "style", &test::test_style },
		{ "fonts", &test::test_fonts },
		{ "paragraph", &test::test_paragraph },
		{ "layout", &test::test_layout },
		{ "table", &test::test_table },
		{ "frame", &test::test_frame },
		{ "document", &test::test_document },
		{ "pdf", &test::test_pdf },
	};

	for(auto& [name, suite] : suites)
	{
		zpr::println("{}:", name);
		suite(context);
	}

	zpr::println("\n{} passed, {} failed, {} skipped", context.passed, context.failed, context.skipped);
	return context.failed == 0 ? 0 : 1;
}
