// metrics.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace font
{
	/*
	    Font-wide metrics, all in font design units (`units_per_em` of them to an em). AFM files
	    always use 1000 units per em. Descent is negative (below the baseline).
	*/
	struct FontMetrics
	{
		double units_per_em = 1000;

		double ascent = 0;
		double descent = 0;

		double cap_height = 0;
		double x_height = 0;

		double italic_angle = 0;
		double stem_v = 0;

		double xmin = 0;
		double ymin = 0;
		double xmax = 0;
		double ymax = 0;

		bool is_fixed_pitch = false;
	};
}
