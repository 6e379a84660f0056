// element.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "folio/style.h"
#include "folio/cell_decorator.h"

namespace folio
{
	struct Element;

	struct StyledString
	{
		std::string text;
		Style style;
	};

	// a single line of text that is never wrapped
	struct Text
	{
		Text(std::string text, Style style = {});

		const std::string& text() const { return m_string.text; }
		const Style& style() const { return m_string.style; }

	private:
		StyledString m_string;
	};

	/*
	    Text that is wrapped to the available width. A paragraph is a sequence of runs, each with
	    its own (partial) style; wrapping and kerning work across run boundaries, so pushing "A"
	    and then "V" in the same style lays out exactly like pushing "AV".
	*/
	struct Paragraph
	{
		Paragraph() = default;
		explicit Paragraph(std::string text, Style style = {});

		Paragraph& push(std::string text);
		Paragraph& pushStyled(std::string text, Style style);

		Paragraph& setAlignment(Alignment alignment);
		Paragraph aligned(Alignment alignment) const;

		const std::vector<StyledString>& runs() const { return m_runs; }
		Alignment alignment() const { return m_alignment; }

	private:
		std::vector<StyledString> m_runs;
		Alignment m_alignment = Alignment::Left;
	};

	// vertical space, measured in lines of the current style
	struct Break
	{
		explicit Break(double lines = 1.0) : m_lines(lines) { }

		double lines() const { return m_lines; }

	private:
		double m_lines;
	};

	struct PageBreak
	{
	};

	struct LinearLayout
	{
		LinearLayout();
		~LinearLayout();

		LinearLayout(LinearLayout&&);
		LinearLayout& operator=(LinearLayout&&);

		LinearLayout(const LinearLayout&) = delete;
		LinearLayout& operator=(const LinearLayout&) = delete;

		LinearLayout& push(Element element);

		const std::vector<Element>& children() const { return m_children; }
		size_t size() const { return m_children.size(); }
		bool empty() const { return m_children.empty(); }

	private:
		std::vector<Element> m_children;
	};


	struct TableLayout;

	struct TableRow
	{
		std::vector<Element> cells;
		std::optional<Colour> background;
	};

	/*
	    Collects the cells of one row; nothing is added to the table until `push` succeeds. The
	    builder refers to the table it came from, so it must not outlive it.
	*/
	struct TableLayoutRow
	{
		TableLayoutRow& element(Element element);
		TableLayoutRow& background(Colour colour);

		[[nodiscard]] ErrorOr<void> push();

	private:
		friend struct TableLayout;
		explicit TableLayoutRow(TableLayout* table);

		TableLayout* m_table;
		std::vector<Element> m_cells;
		std::optional<Colour> m_background;
	};

	struct TableLayout
	{
		explicit TableLayout(std::vector<double> column_weights);
		~TableLayout();

		TableLayout(TableLayout&&);
		TableLayout& operator=(TableLayout&&);

		TableLayout(const TableLayout&) = delete;
		TableLayout& operator=(const TableLayout&) = delete;

		TableLayoutRow row();
		[[nodiscard]] ErrorOr<void> pushRow(std::vector<Element> cells, std::optional<Colour> background = std::nullopt);

		void setCellDecorator(std::unique_ptr<CellDecorator> decorator);
		const CellDecorator* cellDecorator() const { return m_decorator.get(); }

		size_t numColumns() const { return m_weights.size(); }
		const std::vector<double>& weights() const { return m_weights; }
		const std::vector<TableRow>& rows() const { return m_rows; }

	private:
		std::vector<double> m_weights;
		std::vector<TableRow> m_rows;
		std::unique_ptr<CellDecorator> m_decorator;
	};


	// renders the child with this style layered over the inherited one
	struct Styled
	{
		Styled(Element child, Style style);
		~Styled();

		Styled(Styled&&);
		Styled& operator=(Styled&&);

		const Element& child() const { return *m_child; }
		const Style& style() const { return m_style; }

	private:
		std::unique_ptr<Element> m_child;
		Style m_style;
	};

	struct Framed
	{
		Framed(Element child, LineStyle line_style = {});
		~Framed();

		Framed(Framed&&);
		Framed& operator=(Framed&&);

		const Element& child() const { return *m_child; }
		const LineStyle& lineStyle() const { return m_line_style; }

	private:
		std::unique_ptr<Element> m_child;
		LineStyle m_line_style;
	};

	struct Padded
	{
		Padded(Element child, Margins margins);
		~Padded();

		Padded(Padded&&);
		Padded& operator=(Padded&&);

		const Element& child() const { return *m_child; }
		const Margins& margins() const { return m_margins; }

	private:
		std::unique_ptr<Element> m_child;
		Margins m_margins;
	};


	/*
	    Anything that can be placed in a document. The set of elements is closed; the layout
	    engine handles each of them explicitly.
	*/
	struct Element
	{
		using Variant = std::variant<Text, Paragraph, Break, PageBreak, LinearLayout, TableLayout, Styled, Framed, Padded>;

		Element(Text x) : m_variant(std::move(x)) { }
		Element(Paragraph x) : m_variant(std::move(x)) { }
		Element(Break x) : m_variant(std::move(x)) { }
		Element(PageBreak x) : m_variant(std::move(x)) { }
		Element(LinearLayout x) : m_variant(std::move(x)) { }
		Element(TableLayout x) : m_variant(std::move(x)) { }
		Element(Styled x) : m_variant(std::move(x)) { }
		Element(Framed x) : m_variant(std::move(x)) { }
		Element(Padded x) : m_variant(std::move(x)) { }

		const Variant& variant() const { return m_variant; }

		template <typename T>
		bool is() const
		{
			return std::holds_alternative<T>(m_variant);
		}

		template <typename T>
		const T& get() const
		{
			return std::get<T>(m_variant);
		}

		const char* kindName() const;

	private:
		Variant m_variant;
	};

	Element styled(Element element, Style style);
	Element framed(Element element, LineStyle line_style = {});
	Element padded(Element element, Margins margins);
}
