// document_settings.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <optional>

#include "folio/units.h"

namespace folio
{
	struct DocumentSettings
	{
		// sides that are left unset are filled in from the opposite side, then from the others
		struct MarginSettings
		{
			std::optional<Length> top;
			std::optional<Length> bottom;
			std::optional<Length> left;
			std::optional<Length> right;
		};

		std::optional<Size2d> paper_size;
		std::optional<MarginSettings> margins;

		// in points
		std::optional<double> font_size;
		std::optional<double> line_spacing;

		std::optional<std::string> font_family;

		static constexpr double DEFAULT_FONT_SIZE = 12.0;
		static constexpr double DEFAULT_LINE_SPACING = 1.0;
	};

	DocumentSettings fillDefaultSettings(DocumentSettings settings);

	// only valid for filled-in settings
	Margins marginsFromSettings(const DocumentSettings& settings);
}
