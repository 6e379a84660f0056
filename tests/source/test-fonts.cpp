// test-fonts.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "font/afm.h"

namespace test
{
	static void test_builtin_metrics(Context& ctx)
	{
		begin(ctx, "builtin helvetica metrics");

		auto fonts = folio::AfmFontBackend();
		auto family = fonts.resolveFamily("Helvetica");
		if(not check_ok(ctx, family, "resolve Helvetica"))
			return;

		auto style = folio::Style()
		                 .with_font_family(family.unwrap())
		                 .with_font_size(12)
		                 .with_line_spacing(1)
		                 .with_colour(folio::Colour::black())
		                 .with_bold(false)
		                 .with_italic(false);

		check(ctx, style.font()->name() == "Helvetica", "regular face is '{}'", style.font()->name());
		check(ctx, style.extendWith(folio::Style().bold()).font()->name() == "Helvetica-Bold", "bold face");
		check(ctx, style.extendWith(folio::Style().bold().italic()).font()->name() == "Helvetica-BoldOblique",
		    "bold italic face");

		// f o o b a r = 278 + 556 + 556 + 556 + 556 + 333 = 2835 units
		auto advances = fonts.measure(style, U"foobar");
		auto total = folio::Length(0);
		for(auto a : advances)
			total += a;

		check(ctx, advances.size() == 6, "one advance per codepoint");
		check(ctx, approx(total, folio::pointsToLength(34.02)), "'foobar' is {.3f}mm wide", total.value());

		// ascender 718, descender -207
		auto metrics = fonts.lineMetrics(style);
		check(ctx, approx(metrics.height(), folio::pointsToLength(11.1)), "line height is {.3f}mm",
		    metrics.height().value());
		check(ctx, approx(metrics.ascent, folio::pointsToLength(718 * 12 / 1000.0)), "ascent");

		check(ctx, approx(fonts.kerning(style, U'A', U'V'), folio::pointsToLength(-70 * 12 / 1000.0)), "A/V kerning");
		check(ctx, fonts.kerning(style, U'V', U'V').iszero(), "no kerning for V/V");
	}

	static void test_family_fallback(Context& ctx)
	{
		begin(ctx, "missing families");

		auto fonts = folio::AfmFontBackend();

		auto fallback = fonts.resolveFamily("Garamond");
		if(check_ok(ctx, fallback, "fallback is used"))
			check(ctx, fallback.unwrap() == fonts.builtinFamily(), "fallback is the builtin family");

		fonts.setBuiltinFallback(false);
		check_err(ctx, fonts.resolveFamily("Garamond"), folio::Error::Kind::Configuration, "no fallback");

		// the builtin family never needs a fallback
		check_ok(ctx, fonts.resolveFamily("Helvetica"), "builtin without fallback");
	}

	static constexpr const char* TEST_AFM = R"afm(StartFontMetrics 4.1
Comment a tiny font for testing
FontName Tiny-{}
ItalicAngle 0
IsFixedPitch true
FontBBox 0 -250 600 750
Ascender 750
Descender -250
StartCharMetrics 4
C 32 ; WX 600 ; N space ;
C 65 ; WX 600 ; N A ;
C 86 ; WX 600 ; N V ;
C -1 ; WX 600 ; N some.unmapped.glyph ;
EndCharMetrics
StartKernData
StartKernPairs 1
KPX A V -50
EndKernPairs
EndKernData
EndFontMetrics
)afm";

	static void test_family_from_files(Context& ctx)
	{
		begin(ctx, "families from AFM files");

		auto dir = stdfs::temp_directory_path() / "folio-test-fonts";
		stdfs::create_directories(dir);

		for(auto face : { "Regular", "Italic", "Bold", "BoldItalic" })
		{
			auto contents = zpr::sprint(TEST_AFM, face);
			util::writeEntireFile((dir / zpr::sprint("Tiny-{}.afm", face)).string(),
			    zst::str_view(contents).bytes());
		}

		// a family with a face missing cannot be loaded
		util::writeEntireFile((dir / "Partial-Regular.afm").string(), zst::str_view(TEST_AFM).bytes());
		util::writeEntireFile((dir / "Broken-Regular.afm").string(), zst::str_view("hello").bytes());
		for(auto face : { "Italic", "Bold", "BoldItalic" })
			util::writeEntireFile((dir / zpr::sprint("Broken-{}.afm", face)).string(), zst::str_view(TEST_AFM).bytes());

		auto fonts = folio::AfmFontBackend();
		fonts.addSearchPath(dir.string());
		fonts.setBuiltinFallback(false);

		auto family = fonts.resolveFamily("Tiny");
		if(check_ok(ctx, family, "load Tiny"))
		{
			auto fam = family.unwrap();
			check(ctx, fam.regular()->name() == "Tiny-Regular", "regular face is '{}'", fam.regular()->name());
			check(ctx, fam.boldItalic()->name() == "Tiny-BoldItalic", "bold italic face");
			check(ctx, fam.regular()->glyphAdvance(U'A') == 600, "advance of A");
			check(ctx, fam.regular()->kerningAdjustment(U'A', U'V') == -50, "kerning of AV");
			check(ctx, not fam.regular()->isStandardFont(), "file fonts are not standard fonts");

			// the second lookup comes from the cache
			auto again = fonts.resolveFamily("Tiny");
			check(ctx, again.ok() && again.unwrap() == fam, "families are cached");
		}

		check_err(ctx, fonts.resolveFamily("Partial"), folio::Error::Kind::Configuration, "partial family");
		check_err(ctx, fonts.resolveFamily("Broken"), folio::Error::Kind::Configuration, "malformed file");

		stdfs::remove_all(dir);
	}

	static void test_afm_parsing(Context& ctx)
	{
		begin(ctx, "AFM parsing");

		check_err(ctx, font::AfmFont::parse("FontName Foo\n"), folio::Error::Kind::Configuration, "missing header");
		check_err(ctx, font::AfmFont::parse("StartFontMetrics 4.1\nStartCharMetrics 1\nC 65 ; WX 500 ; N A ;\n"),
		    folio::Error::Kind::Configuration, "missing FontName");
		check_err(ctx, font::AfmFont::parse("StartFontMetrics 4.1\nFontName X\nStartCharMetrics 1\nC 65 ; WX abc ; N A ;\n"),
		    folio::Error::Kind::Configuration, "bad number");

		auto ok = font::AfmFont::parse("StartFontMetrics 4.1\nFontName X\nFontBBox 0 -100 500 900\n"
		                               "StartCharMetrics 2\nC 65 ; WX 500 ; N A ;\nC 66 ; WX 400 ; N B ;\n");
		if(check_ok(ctx, ok, "minimal font"))
		{
			auto& font = ok.unwrap();
			check(ctx, font->numGlyphs() == 2, "two glyphs");
			check(ctx, font->hasGlyph(U'B') && not font->hasGlyph(U'C'), "hasGlyph");
			check(ctx, font->metrics().ascent == 900 && font->metrics().descent == -100,
			    "ascent and descent fall back to the bounding box");
		}
	}

	void test_fonts(Context& ctx)
	{
		test_builtin_metrics(ctx);
		test_family_fallback(ctx);
		test_family_from_files(ctx);
		test_afm_parsing(ctx);
	}
}
