// default_settings.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/font_backend.h"
#include "folio/document_settings.h"

namespace folio
{
	static constexpr auto DEFAULT_PAPER_SIZE = Size2d(210, 297);

	DocumentSettings fillDefaultSettings(DocumentSettings settings)
	{
		settings.font_size = settings.font_size.value_or(DocumentSettings::DEFAULT_FONT_SIZE);
		settings.line_spacing = settings.line_spacing.value_or(DocumentSettings::DEFAULT_LINE_SPACING);
		settings.paper_size = settings.paper_size.value_or(DEFAULT_PAPER_SIZE);
		settings.font_family = settings.font_family.value_or(AfmFontBackend::BUILTIN_FAMILY_NAME);

		if(settings.margins.has_value())
		{
			auto& m = *settings.margins;
			auto first_of = [](auto&... xs) -> Length {
				std::optional<Length> ret {};
				((ret = ret.has_value() ? ret : xs), ...);
				return ret.value_or(Length(0));
			};

			if(not m.top.has_value())
				m.top = first_of(m.bottom, m.left, m.right);
			if(not m.bottom.has_value())
				m.bottom = first_of(m.top, m.left, m.right);
			if(not m.left.has_value())
				m.left = first_of(m.right, m.top, m.bottom);
			if(not m.right.has_value())
				m.right = first_of(m.left, m.top, m.bottom);
		}
		else
		{
			settings.margins = DocumentSettings::MarginSettings {
				.top = Length(0),
				.bottom = Length(0),
				.left = Length(0),
				.right = Length(0),
			};
		}

		return settings;
	}

	Margins marginsFromSettings(const DocumentSettings& settings)
	{
		auto& m = settings.margins.value();
		return Margins::trbl(m.top.value(), m.right.value(), m.bottom.value(), m.left.value());
	}
}
