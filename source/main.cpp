// main.cpp
// Copyright (c) 2021, yuki
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#define ZARG_IMPLEMENTATION
#include <zarg.h>

#include "folio.h"
#include "pdf/backend.h"

using namespace folio::literals;

namespace samples
{
	using folio::Document;
	using folio::ErrorOr;

	static ErrorOr<void> invoice(Document& doc)
	{
		auto title = folio::Style().with_font_size(18).bold();

		doc.push(folio::Paragraph("Invoice #2024-0117", title));
		doc.push(folio::Paragraph("Kettle & Sons Hardware, 12 Cooper Lane").aligned(folio::Alignment::Right));
		doc.push(folio::Break(1.5));

		auto table = folio::TableLayout({ 4, 1, 1.5 });
		table.setCellDecorator(std::make_unique<folio::FrameCellDecorator>(true, true, false));

		auto header = folio::Style().bold();
		TRY(table.row()
		        .element(folio::Paragraph("Item", header))
		        .element(folio::Paragraph("Qty", header))
		        .element(folio::Paragraph("Price", header))
		        .background(folio::Colour::greyscale(220))
		        .push());

		const std::pair<const char*, double> items[] = {
			{ "Galvanised wood screws, 4 x 40 mm, box of 200", 3 },
			{ "Claw hammer, fibreglass handle", 1 },
			{ "Masking tape, 24 mm x 50 m", 6 },
			{ "Wall plugs, assorted", 2 },
		};

		double total = 0;
		for(size_t i = 0; i < std::size(items); i++)
		{
			auto price = 4.25 * static_cast<double>(i + 1);
			total += price * items[i].second;

			TRY(table.row()
			        .element(folio::Paragraph(items[i].first))
			        .element(folio::Paragraph(zpr::sprint("{}", items[i].second)))
			        .element(folio::Paragraph(zpr::sprint("{.2f}", price)).aligned(folio::Alignment::Right))
			        .push());
		}

		doc.push(std::move(table));
		doc.push(folio::Break());
		doc.push(folio::Paragraph(zpr::sprint("Total due: {.2f}", total), folio::Style().bold())
		             .aligned(folio::Alignment::Right));

		return folio::Ok();
	}

	static ErrorOr<void> frames(Document& doc)
	{
		auto text = std::string();
		for(int i = 0; i < 12; i++)
			text += "Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor incididunt ut "
			        "labore et dolore magna aliqua. ";

		doc.push(folio::framed(folio::Paragraph("A short framed paragraph.")));
		doc.push(folio::Break());
		doc.push(folio::framed(folio::padded(folio::Paragraph(text), folio::Margins::all(2_mm)),
		    folio::LineStyle().with_thickness(0.5_mm)));

		return folio::Ok();
	}

	static ErrorOr<void> kerning(Document& doc)
	{
		auto big = folio::Style().with_font_size(36);

		doc.push(folio::Paragraph("AVATAR WAVY Tyre", big));

		auto split = folio::Paragraph();
		for(auto piece : { "A", "V", "A", "T", "A", "R", " ", "W", "A", "V", "Y", " ", "T", "y", "r", "e" })
			split.pushStyled(piece, big);

		doc.push(std::move(split));
		doc.push(folio::Paragraph("Both lines above should look identical."));

		return folio::Ok();
	}

	static ErrorOr<void> text(Document& doc)
	{
		doc.push(folio::Text("A single unwrapped line of text."));
		doc.push(folio::Break());

		auto para = folio::Paragraph("Paragraphs can mix ");
		para.pushStyled("bold", folio::Style().bold());
		para.push(", ");
		para.pushStyled("italic", folio::Style().italic());
		para.push(" and ");
		para.pushStyled("coloured", folio::Style().with_colour(folio::Colour::rgb(200, 30, 30)));
		para.push(" runs, all of which wrap together across the width of the page.");
		doc.push(std::move(para));

		doc.push(folio::Break());
		doc.push(folio::Paragraph("Centred.").aligned(folio::Alignment::Centre));
		doc.push(folio::Paragraph("Right.").aligned(folio::Alignment::Right));

		doc.push(folio::PageBreak());
		doc.push(folio::styled(folio::Paragraph("The second page, in a larger size."), folio::Style().with_font_size(16)));

		return folio::Ok();
	}

	static const std::pair<const char*, ErrorOr<void> (*)(Document&)> ALL[] = {
		{ "invoice", &invoice },
		{ "frames", &frames },
		{ "kerning", &kerning },
		{ "text", &text },
	};
}

static folio::ErrorOr<zst::byte_buffer> render_sample(folio::ErrorOr<void> (*build)(folio::Document&),
    folio::FontBackend* fonts,
    folio::DocumentSettings settings,
    bool compress)
{
	auto doc = TRY(folio::Document::create(fonts, std::move(settings)));

	auto decorator = std::make_unique<folio::SimplePageDecorator>(folio::Margins::all(20_mm));
	decorator->setHeader([](size_t page_num) -> std::optional<folio::Element> {
		if(page_num == 1)
			return std::nullopt;

		return folio::Paragraph(zpr::sprint("page {}", page_num), folio::Style().with_font_size(9))
		    .aligned(folio::Alignment::Right);
	});
	doc.setPageDecorator(std::move(decorator));

	TRY(build(doc));

	auto backend = pdf::PdfBackend();
	backend.setCompressed(compress);

	return doc.render(backend);
}

int main(int argc, char** argv)
{
	auto args = zarg::Parser()
	                .add_option('o', true, "output filename")
	                .add_option("font-dir", true, "directory to search for AFM font families")
	                .add_option("font", true, "default font family")
	                .add_option("no-compress", false, "do not compress content streams")
	                .add_option("verbose", false, "print debugging output")
	                .allow_options_after_positionals(true)
	                .parse(argc, argv)
	                .set();

	if(args.positional.size() != 1)
	{
		zpr::fprintln(stderr, "expected exactly one sample name (one of: invoice, frames, kerning, text)");
		return 1;
	}

	if(args.options.contains("verbose"))
		folio::setLogLevel(folio::LogLevel::Debug);

	auto& sample_name = args.positional[0];
	auto sample = std::find_if(std::begin(samples::ALL), std::end(samples::ALL), [&sample_name](const auto& s) {
		return sample_name == s.first;
	});

	if(sample == std::end(samples::ALL))
	{
		zpr::fprintln(stderr, "unknown sample '{}'", sample_name);
		return 1;
	}

	auto fonts = folio::AfmFontBackend();
	if(auto dir = args.options["font-dir"].value; dir.has_value())
		fonts.addSearchPath(*dir);

	auto settings = folio::DocumentSettings {};
	settings.font_family = args.options["font"].value;

	auto output = render_sample(sample->second, &fonts, std::move(settings), not args.options.contains("no-compress"));
	if(output.is_err())
		output.error().showAndExit();

	auto output_name = args.options["o"].value.value_or(zpr::sprint("{}.pdf", sample_name));
	if(not util::writeEntireFile(output_name, output.unwrap().span()))
		return 1;

	folio::log("folio", "wrote '{}'", output_name);
}
