// builtin_helvetica.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "font/builtin.h"

namespace font::builtin
{
	// metrics for the standard helvetica faces, in AFM form; restricted to the WinAnsi repertoire.
	static constexpr const char* HELVETICA_REGULAR = R"afm(StartFontMetrics 4.1
FontName Helvetica
FullName Helvetica
FamilyName Helvetica
Weight Medium
ItalicAngle 0
IsFixedPitch false
FontBBox -166 -225 1000 931
EncodingScheme WinAnsiEncoding
CapHeight 718
XHeight 523
Ascender 718
Descender -207
StdVW 88
StartCharMetrics 223
C 32 ; WX 278 ; N space ;
C 33 ; WX 278 ; N exclam ;
C 34 ; WX 355 ; N quotedbl ;
C 35 ; WX 556 ; N numbersign ;
C 36 ; WX 556 ; N dollar ;
C 37 ; WX 889 ; N percent ;
C 38 ; WX 667 ; N ampersand ;
C 39 ; WX 191 ; N quotesingle ;
C 40 ; WX 333 ; N parenleft ;
C 41 ; WX 333 ; N parenright ;
C 42 ; WX 389 ; N asterisk ;
C 43 ; WX 584 ; N plus ;
C 44 ; WX 278 ; N comma ;
C 45 ; WX 333 ; N hyphen ;
C 46 ; WX 278 ; N period ;
C 47 ; WX 278 ; N slash ;
C 48 ; WX 556 ; N zero ;
C 49 ; WX 556 ; N one ;
C 50 ; WX 556 ; N two ;
C 51 ; WX 556 ; N three ;
C 52 ; WX 556 ; N four ;
C 53 ; WX 556 ; N five ;
C 54 ; WX 556 ; N six ;
C 55 ; WX 556 ; N seven ;
C 56 ; WX 556 ; N eight ;
C 57 ; WX 556 ; N nine ;
C 58 ; WX 278 ; N colon ;
C 59 ; WX 278 ; N semicolon ;
C 60 ; WX 584 ; N less ;
C 61 ; WX 584 ; N equal ;
C 62 ; WX 584 ; N greater ;
C 63 ; WX 556 ; N question ;
C 64 ; WX 1015 ; N at ;
C 65 ; WX 667 ; N A ;
C 66 ; WX 667 ; N B ;
C 67 ; WX 722 ; N C ;
C 68 ; WX 722 ; N D ;
C 69 ; WX 667 ; N E ;
C 70 ; WX 611 ; N F ;
C 71 ; WX 778 ; N G ;
C 72 ; WX 722 ; N H ;
C 73 ; WX 278 ; N I ;
C 74 ; WX 500 ; N J ;
C 75 ; WX 667 ; N K ;
C 76 ; WX 556 ; N L ;
C 77 ; WX 833 ; N M ;
C 78 ; WX 722 ; N N ;
C 79 ; WX 778 ; N O ;
C 80 ; WX 667 ; N P ;
C 81 ; WX 778 ; N Q ;
C 82 ; WX 722 ; N R ;
C 83 ; WX 667 ; N S ;
C 84 ; WX 611 ; N T ;
C 85 ; WX 722 ; N U ;
C 86 ; WX 667 ; N V ;
C 87 ; WX 944 ; N W ;
C 88 ; WX 667 ; N X ;
C 89 ; WX 667 ; N Y ;
C 90 ; WX 611 ; N Z ;
C 91 ; WX 278 ; N bracketleft ;
C 92 ; WX 278 ; N backslash ;
C 93 ; WX 278 ; N bracketright ;
C 94 ; WX 469 ; N asciicircum ;
C 95 ; WX 556 ; N underscore ;
C 96 ; WX 333 ; N grave ;
C 97 ; WX 556 ; N a ;
C 98 ; WX 556 ; N b ;
C 99 ; WX 500 ; N c ;
C 100 ; WX 556 ; N d ;
C 101 ; WX 556 ; N e ;
C 102 ; WX 278 ; N f ;
C 103 ; WX 556 ; N g ;
C 104 ; WX 556 ; N h ;
C 105 ; WX 222 ; N i ;
C 106 ; WX 222 ; N j ;
C 107 ; WX 500 ; N k ;
C 108 ; WX 222 ; N l ;
C 109 ; WX 833 ; N m ;
C 110 ; WX 556 ; N n ;
C 111 ; WX 556 ; N o ;
C 112 ; WX 556 ; N p ;
C 113 ; WX 556 ; N q ;
C 114 ; WX 333 ; N r ;
C 115 ; WX 500 ; N s ;
C 116 ; WX 278 ; N t ;
C 117 ; WX 556 ; N u ;
C 118 ; WX 500 ; N v ;
C 119 ; WX 722 ; N w ;
C 120 ; WX 500 ; N x ;
C 121 ; WX 500 ; N y ;
C 122 ; WX 500 ; N z ;
C 123 ; WX 334 ; N braceleft ;
C 124 ; WX 260 ; N bar ;
C 125 ; WX 334 ; N braceright ;
C 126 ; WX 584 ; N asciitilde ;
C 128 ; WX 556 ; N Euro ;
C 130 ; WX 222 ; N quotesinglbase ;
C 131 ; WX 556 ; N florin ;
C 132 ; WX 333 ; N quotedblbase ;
C 133 ; WX 1000 ; N ellipsis ;
C 134 ; WX 556 ; N dagger ;
C 135 ; WX 556 ; N daggerdbl ;
C 136 ; WX 333 ; N circumflex ;
C 137 ; WX 1000 ; N perthousand ;
C 138 ; WX 667 ; N Scaron ;
C 139 ; WX 333 ; N guilsinglleft ;
C 140 ; WX 1000 ; N OE ;
C 142 ; WX 611 ; N Zcaron ;
C 145 ; WX 222 ; N quoteleft ;
C 146 ; WX 222 ; N quoteright ;
C 147 ; WX 333 ; N quotedblleft ;
C 148 ; WX 333 ; N quotedblright ;
C 149 ; WX 350 ; N bullet ;
C 150 ; WX 556 ; N endash ;
C 151 ; WX 1000 ; N emdash ;
C 152 ; WX 333 ; N tilde ;
C 153 ; WX 1000 ; N trademark ;
C 154 ; WX 500 ; N scaron ;
C 155 ; WX 333 ; N guilsinglright ;
C 156 ; WX 944 ; N oe ;
C 158 ; WX 500 ; N zcaron ;
C 159 ; WX 667 ; N Ydieresis ;
C 161 ; WX 333 ; N exclamdown ;
C 162 ; WX 556 ; N cent ;
C 163 ; WX 556 ; N sterling ;
C 164 ; WX 556 ; N currency ;
C 165 ; WX 556 ; N yen ;
C 166 ; WX 260 ; N brokenbar ;
C 167 ; WX 556 ; N section ;
C 168 ; WX 333 ; N dieresis ;
C 169 ; WX 737 ; N copyright ;
C 170 ; WX 370 ; N ordfeminine ;
C 171 ; WX 556 ; N guillemotleft ;
C 172 ; WX 584 ; N logicalnot ;
C 174 ; WX 737 ; N registered ;
C 175 ; WX 333 ; N macron ;
C 176 ; WX 400 ; N degree ;
C 177 ; WX 584 ; N plusminus ;
C 178 ; WX 333 ; N twosuperior ;
C 179 ; WX 333 ; N threesuperior ;
C 180 ; WX 333 ; N acute ;
C 181 ; WX 556 ; N mu ;
C 182 ; WX 537 ; N paragraph ;
C 183 ; WX 278 ; N periodcentered ;
C 184 ; WX 333 ; N cedilla ;
C 185 ; WX 333 ; N onesuperior ;
C 186 ; WX 365 ; N ordmasculine ;
C 187 ; WX 556 ; N guillemotright ;
C 188 ; WX 834 ; N onequarter ;
C 189 ; WX 834 ; N onehalf ;
C 190 ; WX 834 ; N threequarters ;
C 191 ; WX 611 ; N questiondown ;
C 192 ; WX 667 ; N Agrave ;
C 193 ; WX 667 ; N Aacute ;
C 194 ; WX 667 ; N Acircumflex ;
C 195 ; WX 667 ; N Atilde ;
C 196 ; WX 667 ; N Adieresis ;
C 197 ; WX 667 ; N Aring ;
C 198 ; WX 1000 ; N AE ;
C 199 ; WX 722 ; N Ccedilla ;
C 200 ; WX 667 ; N Egrave ;
C 201 ; WX 667 ; N Eacute ;
C 202 ; WX 667 ; N Ecircumflex ;
C 203 ; WX 667 ; N Edieresis ;
C 204 ; WX 278 ; N Igrave ;
C 205 ; WX 278 ; N Iacute ;
C 206 ; WX 278 ; N Icircumflex ;
C 207 ; WX 278 ; N Idieresis ;
C 208 ; WX 722 ; N Eth ;
C 209 ; WX 722 ; N Ntilde ;
C 210 ; WX 778 ; N Ograve ;
C 211 ; WX 778 ; N Oacute ;
C 212 ; WX 778 ; N Ocircumflex ;
C 213 ; WX 778 ; N Otilde ;
C 214 ; WX 778 ; N Odieresis ;
C 215 ; WX 584 ; N multiply ;
C 216 ; WX 778 ; N Oslash ;
C 217 ; WX 722 ; N Ugrave ;
C 218 ; WX 722 ; N Uacute ;
C 219 ; WX 722 ; N Ucircumflex ;
C 220 ; WX 722 ; N Udieresis ;
C 221 ; WX 667 ; N Yacute ;
C 222 ; WX 667 ; N Thorn ;
C 223 ; WX 611 ; N germandbls ;
C 224 ; WX 556 ; N agrave ;
C 225 ; WX 556 ; N aacute ;
C 226 ; WX 556 ; N acircumflex ;
C 227 ; WX 556 ; N atilde ;
C 228 ; WX 556 ; N adieresis ;
C 229 ; WX 556 ; N aring ;
C 230 ; WX 889 ; N ae ;
C 231 ; WX 500 ; N ccedilla ;
C 232 ; WX 556 ; N egrave ;
C 233 ; WX 556 ; N eacute ;
C 234 ; WX 556 ; N ecircumflex ;
C 235 ; WX 556 ; N edieresis ;
C 236 ; WX 278 ; N igrave ;
C 237 ; WX 278 ; N iacute ;
C 238 ; WX 278 ; N icircumflex ;
C 239 ; WX 278 ; N idieresis ;
C 240 ; WX 556 ; N eth ;
C 241 ; WX 556 ; N ntilde ;
C 242 ; WX 556 ; N ograve ;
C 243 ; WX 556 ; N oacute ;
C 244 ; WX 556 ; N ocircumflex ;
C 245 ; WX 556 ; N otilde ;
C 246 ; WX 556 ; N odieresis ;
C 247 ; WX 584 ; N divide ;
C 248 ; WX 611 ; N oslash ;
C 249 ; WX 556 ; N ugrave ;
C 250 ; WX 556 ; N uacute ;
C 251 ; WX 556 ; N ucircumflex ;
C 252 ; WX 556 ; N udieresis ;
C 253 ; WX 500 ; N yacute ;
C 254 ; WX 556 ; N thorn ;
C 255 ; WX 500 ; N ydieresis ;
C -1 ; WX 278 ; N dotlessi ;
C -1 ; WX 500 ; N fi ;
C -1 ; WX 500 ; N fl ;
C -1 ; WX 584 ; N minus ;
C -1 ; WX 167 ; N fraction ;
C -1 ; WX 556 ; N Lslash ;
C -1 ; WX 222 ; N lslash ;
EndCharMetrics
StartKernData
StartKernPairs 214
KPX A C -30
KPX A G -30
KPX A O -30
KPX A Q -30
KPX A T -120
KPX A U -50
KPX A V -70
KPX A W -50
KPX A Y -100
KPX A u -30
KPX A v -40
KPX A w -40
KPX A y -40
KPX B U -10
KPX B comma -20
KPX B period -20
KPX C comma -30
KPX C period -30
KPX D A -40
KPX D V -70
KPX D W -40
KPX D Y -90
KPX D comma -70
KPX D period -70
KPX F A -80
KPX F a -50
KPX F comma -150
KPX F e -30
KPX F o -30
KPX F period -150
KPX F r -45
KPX J A -20
KPX J a -20
KPX J comma -30
KPX J period -30
KPX J u -20
KPX K O -50
KPX K e -40
KPX K o -40
KPX K u -30
KPX K y -50
KPX L T -110
KPX L V -110
KPX L W -70
KPX L Y -140
KPX L quotedblright -140
KPX L quoteright -160
KPX L y -30
KPX O A -20
KPX O T -40
KPX O V -50
KPX O W -30
KPX O X -60
KPX O Y -70
KPX O comma -40
KPX O period -40
KPX P A -120
KPX P a -40
KPX P comma -180
KPX P e -50
KPX P o -50
KPX P period -180
KPX Q U -10
KPX R O -20
KPX R T -30
KPX R U -40
KPX R V -50
KPX R W -30
KPX R Y -50
KPX S comma -20
KPX S period -20
KPX T A -120
KPX T O -40
KPX T a -120
KPX T colon -20
KPX T comma -120
KPX T e -120
KPX T hyphen -140
KPX T o -120
KPX T period -120
KPX T r -120
KPX T semicolon -20
KPX T u -120
KPX T w -120
KPX T y -120
KPX U A -40
KPX U comma -40
KPX U period -40
KPX V A -80
KPX V G -40
KPX V O -40
KPX V a -70
KPX V colon -40
KPX V comma -125
KPX V e -80
KPX V hyphen -80
KPX V o -80
KPX V period -125
KPX V semicolon -40
KPX V u -70
KPX W A -50
KPX W O -20
KPX W a -40
KPX W comma -80
KPX W e -30
KPX W hyphen -40
KPX W o -30
KPX W period -80
KPX W u -30
KPX W y -20
KPX Y A -110
KPX Y O -85
KPX Y a -140
KPX Y colon -60
KPX Y comma -140
KPX Y e -140
KPX Y hyphen -140
KPX Y i -20
KPX Y o -140
KPX Y period -140
KPX Y semicolon -60
KPX Y u -110
KPX Y v -110
KPX a v -20
KPX a w -20
KPX a y -30
KPX b b -10
KPX b comma -40
KPX b l -20
KPX b period -40
KPX b u -20
KPX b v -20
KPX b y -20
KPX c comma -15
KPX c k -20
KPX colon space -50
KPX comma quotedblright -100
KPX comma quoteright -100
KPX e comma -15
KPX e period -15
KPX e v -30
KPX e w -20
KPX e x -30
KPX e y -20
KPX f a -30
KPX f comma -30
KPX f dotlessi -28
KPX f e -30
KPX f o -30
KPX f period -30
KPX f quotedblright 60
KPX f quoteright 50
KPX g r -10
KPX h y -30
KPX k e -20
KPX k o -20
KPX m u -10
KPX m y -15
KPX n u -10
KPX n v -20
KPX n y -15
KPX o comma -40
KPX o period -40
KPX o v -15
KPX o w -15
KPX o x -30
KPX o y -30
KPX p comma -35
KPX p period -35
KPX p y -30
KPX period quotedblright -100
KPX period quoteright -100
KPX period space -60
KPX quotedblright space -40
KPX quoteleft quoteleft -57
KPX quoteright d -50
KPX quoteright quoteright -57
KPX quoteright r -50
KPX quoteright s -50
KPX quoteright space -70
KPX r a -10
KPX r colon 30
KPX r comma -50
KPX r hyphen -20
KPX r period -50
KPX r semicolon 30
KPX s comma -15
KPX s period -15
KPX s w -30
KPX semicolon space -50
KPX space T -50
KPX space V -50
KPX space W -40
KPX space Y -90
KPX space quotedblleft -30
KPX space quoteleft -60
KPX v a -25
KPX v comma -80
KPX v e -25
KPX v o -25
KPX v period -80
KPX w a -15
KPX w comma -60
KPX w e -10
KPX w o -10
KPX w period -60
KPX x e -30
KPX y a -20
KPX y comma -100
KPX y e -20
KPX y o -20
KPX y period -100
KPX z e -15
KPX z o -15
EndKernPairs
EndKernData
EndFontMetrics
)afm";

	static constexpr const char* HELVETICA_BOLD = R"afm(StartFontMetrics 4.1
FontName Helvetica-Bold
FullName Helvetica Bold
FamilyName Helvetica
Weight Bold
ItalicAngle 0
IsFixedPitch false
FontBBox -170 -228 1003 962
EncodingScheme WinAnsiEncoding
CapHeight 718
XHeight 532
Ascender 718
Descender -207
StdVW 140
StartCharMetrics 223
C 32 ; WX 278 ; N space ;
C 33 ; WX 333 ; N exclam ;
C 34 ; WX 474 ; N quotedbl ;
C 35 ; WX 556 ; N numbersign ;
C 36 ; WX 556 ; N dollar ;
C 37 ; WX 889 ; N percent ;
C 38 ; WX 722 ; N ampersand ;
C 39 ; WX 238 ; N quotesingle ;
C 40 ; WX 333 ; N parenleft ;
C 41 ; WX 333 ; N parenright ;
C 42 ; WX 389 ; N asterisk ;
C 43 ; WX 584 ; N plus ;
C 44 ; WX 278 ; N comma ;
C 45 ; WX 333 ; N hyphen ;
C 46 ; WX 278 ; N period ;
C 47 ; WX 278 ; N slash ;
C 48 ; WX 556 ; N zero ;
C 49 ; WX 556 ; N one ;
C 50 ; WX 556 ; N two ;
C 51 ; WX 556 ; N three ;
C 52 ; WX 556 ; N four ;
C 53 ; WX 556 ; N five ;
C 54 ; WX 556 ; N six ;
C 55 ; WX 556 ; N seven ;
C 56 ; WX 556 ; N eight ;
C 57 ; WX 556 ; N nine ;
C 58 ; WX 333 ; N colon ;
C 59 ; WX 333 ; N semicolon ;
C 60 ; WX 584 ; N less ;
C 61 ; WX 584 ; N equal ;
C 62 ; WX 584 ; N greater ;
C 63 ; WX 611 ; N question ;
C 64 ; WX 975 ; N at ;
C 65 ; WX 722 ; N A ;
C 66 ; WX 722 ; N B ;
C 67 ; WX 722 ; N C ;
C 68 ; WX 722 ; N D ;
C 69 ; WX 667 ; N E ;
C 70 ; WX 611 ; N F ;
C 71 ; WX 778 ; N G ;
C 72 ; WX 722 ; N H ;
C 73 ; WX 278 ; N I ;
C 74 ; WX 556 ; N J ;
C 75 ; WX 722 ; N K ;
C 76 ; WX 611 ; N L ;
C 77 ; WX 833 ; N M ;
C 78 ; WX 722 ; N N ;
C 79 ; WX 778 ; N O ;
C 80 ; WX 667 ; N P ;
C 81 ; WX 778 ; N Q ;
C 82 ; WX 722 ; N R ;
C 83 ; WX 667 ; N S ;
C 84 ; WX 611 ; N T ;
C 85 ; WX 722 ; N U ;
C 86 ; WX 667 ; N V ;
C 87 ; WX 944 ; N W ;
C 88 ; WX 667 ; N X ;
C 89 ; WX 667 ; N Y ;
C 90 ; WX 611 ; N Z ;
C 91 ; WX 333 ; N bracketleft ;
C 92 ; WX 278 ; N backslash ;
C 93 ; WX 333 ; N bracketright ;
C 94 ; WX 584 ; N asciicircum ;
C 95 ; WX 556 ; N underscore ;
C 96 ; WX 333 ; N grave ;
C 97 ; WX 556 ; N a ;
C 98 ; WX 611 ; N b ;
C 99 ; WX 556 ; N c ;
C 100 ; WX 611 ; N d ;
C 101 ; WX 556 ; N e ;
C 102 ; WX 333 ; N f ;
C 103 ; WX 611 ; N g ;
C 104 ; WX 611 ; N h ;
C 105 ; WX 278 ; N i ;
C 106 ; WX 278 ; N j ;
C 107 ; WX 556 ; N k ;
C 108 ; WX 278 ; N l ;
C 109 ; WX 889 ; N m ;
C 110 ; WX 611 ; N n ;
C 111 ; WX 611 ; N o ;
C 112 ; WX 611 ; N p ;
C 113 ; WX 611 ; N q ;
C 114 ; WX 389 ; N r ;
C 115 ; WX 556 ; N s ;
C 116 ; WX 333 ; N t ;
C 117 ; WX 611 ; N u ;
C 118 ; WX 556 ; N v ;
C 119 ; WX 778 ; N w ;
C 120 ; WX 556 ; N x ;
C 121 ; WX 556 ; N y ;
C 122 ; WX 500 ; N z ;
C 123 ; WX 389 ; N braceleft ;
C 124 ; WX 280 ; N bar ;
C 125 ; WX 389 ; N braceright ;
C 126 ; WX 584 ; N asciitilde ;
C 128 ; WX 556 ; N Euro ;
C 130 ; WX 278 ; N quotesinglbase ;
C 131 ; WX 556 ; N florin ;
C 132 ; WX 500 ; N quotedblbase ;
C 133 ; WX 1000 ; N ellipsis ;
C 134 ; WX 556 ; N dagger ;
C 135 ; WX 556 ; N daggerdbl ;
C 136 ; WX 333 ; N circumflex ;
C 137 ; WX 1000 ; N perthousand ;
C 138 ; WX 667 ; N Scaron ;
C 139 ; WX 333 ; N guilsinglleft ;
C 140 ; WX 1000 ; N OE ;
C 142 ; WX 611 ; N Zcaron ;
C 145 ; WX 278 ; N quoteleft ;
C 146 ; WX 278 ; N quoteright ;
C 147 ; WX 500 ; N quotedblleft ;
C 148 ; WX 500 ; N quotedblright ;
C 149 ; WX 350 ; N bullet ;
C 150 ; WX 556 ; N endash ;
C 151 ; WX 1000 ; N emdash ;
C 152 ; WX 333 ; N tilde ;
C 153 ; WX 1000 ; N trademark ;
C 154 ; WX 556 ; N scaron ;
C 155 ; WX 333 ; N guilsinglright ;
C 156 ; WX 944 ; N oe ;
C 158 ; WX 500 ; N zcaron ;
C 159 ; WX 667 ; N Ydieresis ;
C 161 ; WX 333 ; N exclamdown ;
C 162 ; WX 556 ; N cent ;
C 163 ; WX 556 ; N sterling ;
C 164 ; WX 556 ; N currency ;
C 165 ; WX 556 ; N yen ;
C 166 ; WX 280 ; N brokenbar ;
C 167 ; WX 556 ; N section ;
C 168 ; WX 333 ; N dieresis ;
C 169 ; WX 737 ; N copyright ;
C 170 ; WX 370 ; N ordfeminine ;
C 171 ; WX 556 ; N guillemotleft ;
C 172 ; WX 584 ; N logicalnot ;
C 174 ; WX 737 ; N registered ;
C 175 ; WX 333 ; N macron ;
C 176 ; WX 400 ; N degree ;
C 177 ; WX 584 ; N plusminus ;
C 178 ; WX 333 ; N twosuperior ;
C 179 ; WX 333 ; N threesuperior ;
C 180 ; WX 333 ; N acute ;
C 181 ; WX 611 ; N mu ;
C 182 ; WX 556 ; N paragraph ;
C 183 ; WX 278 ; N periodcentered ;
C 184 ; WX 333 ; N cedilla ;
C 185 ; WX 333 ; N onesuperior ;
C 186 ; WX 365 ; N ordmasculine ;
C 187 ; WX 556 ; N guillemotright ;
C 188 ; WX 834 ; N onequarter ;
C 189 ; WX 834 ; N onehalf ;
C 190 ; WX 834 ; N threequarters ;
C 191 ; WX 611 ; N questiondown ;
C 192 ; WX 722 ; N Agrave ;
C 193 ; WX 722 ; N Aacute ;
C 194 ; WX 722 ; N Acircumflex ;
C 195 ; WX 722 ; N Atilde ;
C 196 ; WX 722 ; N Adieresis ;
C 197 ; WX 722 ; N Aring ;
C 198 ; WX 1000 ; N AE ;
C 199 ; WX 722 ; N Ccedilla ;
C 200 ; WX 667 ; N Egrave ;
C 201 ; WX 667 ; N Eacute ;
C 202 ; WX 667 ; N Ecircumflex ;
C 203 ; WX 667 ; N Edieresis ;
C 204 ; WX 278 ; N Igrave ;
C 205 ; WX 278 ; N Iacute ;
C 206 ; WX 278 ; N Icircumflex ;
C 207 ; WX 278 ; N Idieresis ;
C 208 ; WX 722 ; N Eth ;
C 209 ; WX 722 ; N Ntilde ;
C 210 ; WX 778 ; N Ograve ;
C 211 ; WX 778 ; N Oacute ;
C 212 ; WX 778 ; N Ocircumflex ;
C 213 ; WX 778 ; N Otilde ;
C 214 ; WX 778 ; N Odieresis ;
C 215 ; WX 584 ; N multiply ;
C 216 ; WX 778 ; N Oslash ;
C 217 ; WX 722 ; N Ugrave ;
C 218 ; WX 722 ; N Uacute ;
C 219 ; WX 722 ; N Ucircumflex ;
C 220 ; WX 722 ; N Udieresis ;
C 221 ; WX 667 ; N Yacute ;
C 222 ; WX 667 ; N Thorn ;
C 223 ; WX 611 ; N germandbls ;
C 224 ; WX 556 ; N agrave ;
C 225 ; WX 556 ; N aacute ;
C 226 ; WX 556 ; N acircumflex ;
C 227 ; WX 556 ; N atilde ;
C 228 ; WX 556 ; N adieresis ;
C 229 ; WX 556 ; N aring ;
C 230 ; WX 889 ; N ae ;
C 231 ; WX 556 ; N ccedilla ;
C 232 ; WX 556 ; N egrave ;
C 233 ; WX 556 ; N eacute ;
C 234 ; WX 556 ; N ecircumflex ;
C 235 ; WX 556 ; N edieresis ;
C 236 ; WX 278 ; N igrave ;
C 237 ; WX 278 ; N iacute ;
C 238 ; WX 278 ; N icircumflex ;
C 239 ; WX 278 ; N idieresis ;
C 240 ; WX 611 ; N eth ;
C 241 ; WX 611 ; N ntilde ;
C 242 ; WX 611 ; N ograve ;
C 243 ; WX 611 ; N oacute ;
C 244 ; WX 611 ; N ocircumflex ;
C 245 ; WX 611 ; N otilde ;
C 246 ; WX 611 ; N odieresis ;
C 247 ; WX 584 ; N divide ;
C 248 ; WX 611 ; N oslash ;
C 249 ; WX 611 ; N ugrave ;
C 250 ; WX 611 ; N uacute ;
C 251 ; WX 611 ; N ucircumflex ;
C 252 ; WX 611 ; N udieresis ;
C 253 ; WX 556 ; N yacute ;
C 254 ; WX 611 ; N thorn ;
C 255 ; WX 556 ; N ydieresis ;
C -1 ; WX 278 ; N dotlessi ;
C -1 ; WX 611 ; N fi ;
C -1 ; WX 611 ; N fl ;
C -1 ; WX 584 ; N minus ;
C -1 ; WX 167 ; N fraction ;
C -1 ; WX 556 ; N Lslash ;
C -1 ; WX 278 ; N lslash ;
EndCharMetrics
StartKernData
StartKernPairs 78
KPX A C -40
KPX A G -50
KPX A O -40
KPX A Q -40
KPX A T -90
KPX A U -50
KPX A V -80
KPX A W -60
KPX A Y -110
KPX A v -40
KPX A w -30
KPX A y -30
KPX D A -40
KPX D V -40
KPX D W -40
KPX D Y -70
KPX F A -80
KPX F comma -100
KPX F period -100
KPX L T -90
KPX L V -110
KPX L W -80
KPX L Y -120
KPX L y -30
KPX O A -50
KPX O T -40
KPX O V -50
KPX O W -50
KPX O Y -70
KPX P A -100
KPX P comma -120
KPX P period -120
KPX R T -20
KPX R V -50
KPX R W -40
KPX R Y -50
KPX T A -90
KPX T a -80
KPX T e -60
KPX T o -80
KPX T comma -80
KPX T period -80
KPX T r -80
KPX T u -90
KPX T y -60
KPX T w -60
KPX V A -80
KPX V a -60
KPX V e -50
KPX V o -90
KPX V comma -120
KPX V period -120
KPX W A -60
KPX W a -40
KPX W e -35
KPX W o -60
KPX W comma -80
KPX W period -80
KPX Y A -110
KPX Y a -100
KPX Y e -80
KPX Y o -100
KPX Y comma -100
KPX Y period -100
KPX Y u -100
KPX e v -15
KPX f quoteright 55
KPX o v -15
KPX o y -15
KPX quoteright s -50
KPX r comma -60
KPX r period -60
KPX v comma -80
KPX v period -80
KPX w comma -40
KPX w period -40
KPX y comma -80
KPX y period -80
EndKernPairs
EndKernData
EndFontMetrics
)afm";

	static constexpr const char* HELVETICA_OBLIQUE = R"afm(StartFontMetrics 4.1
FontName Helvetica-Oblique
FullName Helvetica Oblique
FamilyName Helvetica
Weight Medium
ItalicAngle -12
IsFixedPitch false
FontBBox -170 -225 1116 931
EncodingScheme WinAnsiEncoding
CapHeight 718
XHeight 523
Ascender 718
Descender -207
StdVW 88
StartCharMetrics 223
C 32 ; WX 278 ; N space ;
C 33 ; WX 278 ; N exclam ;
C 34 ; WX 355 ; N quotedbl ;
C 35 ; WX 556 ; N numbersign ;
C 36 ; WX 556 ; N dollar ;
C 37 ; WX 889 ; N percent ;
C 38 ; WX 667 ; N ampersand ;
C 39 ; WX 191 ; N quotesingle ;
C 40 ; WX 333 ; N parenleft ;
C 41 ; WX 333 ; N parenright ;
C 42 ; WX 389 ; N asterisk ;
C 43 ; WX 584 ; N plus ;
C 44 ; WX 278 ; N comma ;
C 45 ; WX 333 ; N hyphen ;
C 46 ; WX 278 ; N period ;
C 47 ; WX 278 ; N slash ;
C 48 ; WX 556 ; N zero ;
C 49 ; WX 556 ; N one ;
C 50 ; WX 556 ; N two ;
C 51 ; WX 556 ; N three ;
C 52 ; WX 556 ; N four ;
C 53 ; WX 556 ; N five ;
C 54 ; WX 556 ; N six ;
C 55 ; WX 556 ; N seven ;
C 56 ; WX 556 ; N eight ;
C 57 ; WX 556 ; N nine ;
C 58 ; WX 278 ; N colon ;
C 59 ; WX 278 ; N semicolon ;
C 60 ; WX 584 ; N less ;
C 61 ; WX 584 ; N equal ;
C 62 ; WX 584 ; N greater ;
C 63 ; WX 556 ; N question ;
C 64 ; WX 1015 ; N at ;
C 65 ; WX 667 ; N A ;
C 66 ; WX 667 ; N B ;
C 67 ; WX 722 ; N C ;
C 68 ; WX 722 ; N D ;
C 69 ; WX 667 ; N E ;
C 70 ; WX 611 ; N F ;
C 71 ; WX 778 ; N G ;
C 72 ; WX 722 ; N H ;
C 73 ; WX 278 ; N I ;
C 74 ; WX 500 ; N J ;
C 75 ; WX 667 ; N K ;
C 76 ; WX 556 ; N L ;
C 77 ; WX 833 ; N M ;
C 78 ; WX 722 ; N N ;
C 79 ; WX 778 ; N O ;
C 80 ; WX 667 ; N P ;
C 81 ; WX 778 ; N Q ;
C 82 ; WX 722 ; N R ;
C 83 ; WX 667 ; N S ;
C 84 ; WX 611 ; N T ;
C 85 ; WX 722 ; N U ;
C 86 ; WX 667 ; N V ;
C 87 ; WX 944 ; N W ;
C 88 ; WX 667 ; N X ;
C 89 ; WX 667 ; N Y ;
C 90 ; WX 611 ; N Z ;
C 91 ; WX 278 ; N bracketleft ;
C 92 ; WX 278 ; N backslash ;
C 93 ; WX 278 ; N bracketright ;
C 94 ; WX 469 ; N asciicircum ;
C 95 ; WX 556 ; N underscore ;
C 96 ; WX 333 ; N grave ;
C 97 ; WX 556 ; N a ;
C 98 ; WX 556 ; N b ;
C 99 ; WX 500 ; N c ;
C 100 ; WX 556 ; N d ;
C 101 ; WX 556 ; N e ;
C 102 ; WX 278 ; N f ;
C 103 ; WX 556 ; N g ;
C 104 ; WX 556 ; N h ;
C 105 ; WX 222 ; N i ;
C 106 ; WX 222 ; N j ;
C 107 ; WX 500 ; N k ;
C 108 ; WX 222 ; N l ;
C 109 ; WX 833 ; N m ;
C 110 ; WX 556 ; N n ;
C 111 ; WX 556 ; N o ;
C 112 ; WX 556 ; N p ;
C 113 ; WX 556 ; N q ;
C 114 ; WX 333 ; N r ;
C 115 ; WX 500 ; N s ;
C 116 ; WX 278 ; N t ;
C 117 ; WX 556 ; N u ;
C 118 ; WX 500 ; N v ;
C 119 ; WX 722 ; N w ;
C 120 ; WX 500 ; N x ;
C 121 ; WX 500 ; N y ;
C 122 ; WX 500 ; N z ;
C 123 ; WX 334 ; N braceleft ;
C 124 ; WX 260 ; N bar ;
C 125 ; WX 334 ; N braceright ;
C 126 ; WX 584 ; N asciitilde ;
C 128 ; WX 556 ; N Euro ;
C 130 ; WX 222 ; N quotesinglbase ;
C 131 ; WX 556 ; N florin ;
C 132 ; WX 333 ; N quotedblbase ;
C 133 ; WX 1000 ; N ellipsis ;
C 134 ; WX 556 ; N dagger ;
C 135 ; WX 556 ; N daggerdbl ;
C 136 ; WX 333 ; N circumflex ;
C 137 ; WX 1000 ; N perthousand ;
C 138 ; WX 667 ; N Scaron ;
C 139 ; WX 333 ; N guilsinglleft ;
C 140 ; WX 1000 ; N OE ;
C 142 ; WX 611 ; N Zcaron ;
C 145 ; WX 222 ; N quoteleft ;
C 146 ; WX 222 ; N quoteright ;
C 147 ; WX 333 ; N quotedblleft ;
C 148 ; WX 333 ; N quotedblright ;
C 149 ; WX 350 ; N bullet ;
C 150 ; WX 556 ; N endash ;
C 151 ; WX 1000 ; N emdash ;
C 152 ; WX 333 ; N tilde ;
C 153 ; WX 1000 ; N trademark ;
C 154 ; WX 500 ; N scaron ;
C 155 ; WX 333 ; N guilsinglright ;
C 156 ; WX 944 ; N oe ;
C 158 ; WX 500 ; N zcaron ;
C 159 ; WX 667 ; N Ydieresis ;
C 161 ; WX 333 ; N exclamdown ;
C 162 ; WX 556 ; N cent ;
C 163 ; WX 556 ; N sterling ;
C 164 ; WX 556 ; N currency ;
C 165 ; WX 556 ; N yen ;
C 166 ; WX 260 ; N brokenbar ;
C 167 ; WX 556 ; N section ;
C 168 ; WX 333 ; N dieresis ;
C 169 ; WX 737 ; N copyright ;
C 170 ; WX 370 ; N ordfeminine ;
C 171 ; WX 556 ; N guillemotleft ;
C 172 ; WX 584 ; N logicalnot ;
C 174 ; WX 737 ; N registered ;
C 175 ; WX 333 ; N macron ;
C 176 ; WX 400 ; N degree ;
C 177 ; WX 584 ; N plusminus ;
C 178 ; WX 333 ; N twosuperior ;
C 179 ; WX 333 ; N threesuperior ;
C 180 ; WX 333 ; N acute ;
C 181 ; WX 556 ; N mu ;
C 182 ; WX 537 ; N paragraph ;
C 183 ; WX 278 ; N periodcentered ;
C 184 ; WX 333 ; N cedilla ;
C 185 ; WX 333 ; N onesuperior ;
C 186 ; WX 365 ; N ordmasculine ;
C 187 ; WX 556 ; N guillemotright ;
C 188 ; WX 834 ; N onequarter ;
C 189 ; WX 834 ; N onehalf ;
C 190 ; WX 834 ; N threequarters ;
C 191 ; WX 611 ; N questiondown ;
C 192 ; WX 667 ; N Agrave ;
C 193 ; WX 667 ; N Aacute ;
C 194 ; WX 667 ; N Acircumflex ;
C 195 ; WX 667 ; N Atilde ;
C 196 ; WX 667 ; N Adieresis ;
C 197 ; WX 667 ; N Aring ;
C 198 ; WX 1000 ; N AE ;
C 199 ; WX 722 ; N Ccedilla ;
C 200 ; WX 667 ; N Egrave ;
C 201 ; WX 667 ; N Eacute ;
C 202 ; WX 667 ; N Ecircumflex ;
C 203 ; WX 667 ; N Edieresis ;
C 204 ; WX 278 ; N Igrave ;
C 205 ; WX 278 ; N Iacute ;
C 206 ; WX 278 ; N Icircumflex ;
C 207 ; WX 278 ; N Idieresis ;
C 208 ; WX 722 ; N Eth ;
C 209 ; WX 722 ; N Ntilde ;
C 210 ; WX 778 ; N Ograve ;
C 211 ; WX 778 ; N Oacute ;
C 212 ; WX 778 ; N Ocircumflex ;
C 213 ; WX 778 ; N Otilde ;
C 214 ; WX 778 ; N Odieresis ;
C 215 ; WX 584 ; N multiply ;
C 216 ; WX 778 ; N Oslash ;
C 217 ; WX 722 ; N Ugrave ;
C 218 ; WX 722 ; N Uacute ;
C 219 ; WX 722 ; N Ucircumflex ;
C 220 ; WX 722 ; N Udieresis ;
C 221 ; WX 667 ; N Yacute ;
C 222 ; WX 667 ; N Thorn ;
C 223 ; WX 611 ; N germandbls ;
C 224 ; WX 556 ; N agrave ;
C 225 ; WX 556 ; N aacute ;
C 226 ; WX 556 ; N acircumflex ;
C 227 ; WX 556 ; N atilde ;
C 228 ; WX 556 ; N adieresis ;
C 229 ; WX 556 ; N aring ;
C 230 ; WX 889 ; N ae ;
C 231 ; WX 500 ; N ccedilla ;
C 232 ; WX 556 ; N egrave ;
C 233 ; WX 556 ; N eacute ;
C 234 ; WX 556 ; N ecircumflex ;
C 235 ; WX 556 ; N edieresis ;
C 236 ; WX 278 ; N igrave ;
C 237 ; WX 278 ; N iacute ;
C 238 ; WX 278 ; N icircumflex ;
C 239 ; WX 278 ; N idieresis ;
C 240 ; WX 556 ; N eth ;
C 241 ; WX 556 ; N ntilde ;
C 242 ; WX 556 ; N ograve ;
C 243 ; WX 556 ; N oacute ;
C 244 ; WX 556 ; N ocircumflex ;
C 245 ; WX 556 ; N otilde ;
C 246 ; WX 556 ; N odieresis ;
C 247 ; WX 584 ; N divide ;
C 248 ; WX 611 ; N oslash ;
C 249 ; WX 556 ; N ugrave ;
C 250 ; WX 556 ; N uacute ;
C 251 ; WX 556 ; N ucircumflex ;
C 252 ; WX 556 ; N udieresis ;
C 253 ; WX 500 ; N yacute ;
C 254 ; WX 556 ; N thorn ;
C 255 ; WX 500 ; N ydieresis ;
C -1 ; WX 278 ; N dotlessi ;
C -1 ; WX 500 ; N fi ;
C -1 ; WX 500 ; N fl ;
C -1 ; WX 584 ; N minus ;
C -1 ; WX 167 ; N fraction ;
C -1 ; WX 556 ; N Lslash ;
C -1 ; WX 222 ; N lslash ;
EndCharMetrics
StartKernData
StartKernPairs 214
KPX A C -30
KPX A G -30
KPX A O -30
KPX A Q -30
KPX A T -120
KPX A U -50
KPX A V -70
KPX A W -50
KPX A Y -100
KPX A u -30
KPX A v -40
KPX A w -40
KPX A y -40
KPX B U -10
KPX B comma -20
KPX B period -20
KPX C comma -30
KPX C period -30
KPX D A -40
KPX D V -70
KPX D W -40
KPX D Y -90
KPX D comma -70
KPX D period -70
KPX F A -80
KPX F a -50
KPX F comma -150
KPX F e -30
KPX F o -30
KPX F period -150
KPX F r -45
KPX J A -20
KPX J a -20
KPX J comma -30
KPX J period -30
KPX J u -20
KPX K O -50
KPX K e -40
KPX K o -40
KPX K u -30
KPX K y -50
KPX L T -110
KPX L V -110
KPX L W -70
KPX L Y -140
KPX L quotedblright -140
KPX L quoteright -160
KPX L y -30
KPX O A -20
KPX O T -40
KPX O V -50
KPX O W -30
KPX O X -60
KPX O Y -70
KPX O comma -40
KPX O period -40
KPX P A -120
KPX P a -40
KPX P comma -180
KPX P e -50
KPX P o -50
KPX P period -180
KPX Q U -10
KPX R O -20
KPX R T -30
KPX R U -40
KPX R V -50
KPX R W -30
KPX R Y -50
KPX S comma -20
KPX S period -20
KPX T A -120
KPX T O -40
KPX T a -120
KPX T colon -20
KPX T comma -120
KPX T e -120
KPX T hyphen -140
KPX T o -120
KPX T period -120
KPX T r -120
KPX T semicolon -20
KPX T u -120
KPX T w -120
KPX T y -120
KPX U A -40
KPX U comma -40
KPX U period -40
KPX V A -80
KPX V G -40
KPX V O -40
KPX V a -70
KPX V colon -40
KPX V comma -125
KPX V e -80
KPX V hyphen -80
KPX V o -80
KPX V period -125
KPX V semicolon -40
KPX V u -70
KPX W A -50
KPX W O -20
KPX W a -40
KPX W comma -80
KPX W e -30
KPX W hyphen -40
KPX W o -30
KPX W period -80
KPX W u -30
KPX W y -20
KPX Y A -110
KPX Y O -85
KPX Y a -140
KPX Y colon -60
KPX Y comma -140
KPX Y e -140
KPX Y hyphen -140
KPX Y i -20
KPX Y o -140
KPX Y period -140
KPX Y semicolon -60
KPX Y u -110
KPX Y v -110
KPX a v -20
KPX a w -20
KPX a y -30
KPX b b -10
KPX b comma -40
KPX b l -20
KPX b period -40
KPX b u -20
KPX b v -20
KPX b y -20
KPX c comma -15
KPX c k -20
KPX colon space -50
KPX comma quotedblright -100
KPX comma quoteright -100
KPX e comma -15
KPX e period -15
KPX e v -30
KPX e w -20
KPX e x -30
KPX e y -20
KPX f a -30
KPX f comma -30
KPX f dotlessi -28
KPX f e -30
KPX f o -30
KPX f period -30
KPX f quotedblright 60
KPX f quoteright 50
KPX g r -10
KPX h y -30
KPX k e -20
KPX k o -20
KPX m u -10
KPX m y -15
KPX n u -10
KPX n v -20
KPX n y -15
KPX o comma -40
KPX o period -40
KPX o v -15
KPX o w -15
KPX o x -30
KPX o y -30
KPX p comma -35
KPX p period -35
KPX p y -30
KPX period quotedblright -100
KPX period quoteright -100
KPX period space -60
KPX quotedblright space -40
KPX quoteleft quoteleft -57
KPX quoteright d -50
KPX quoteright quoteright -57
KPX quoteright r -50
KPX quoteright s -50
KPX quoteright space -70
KPX r a -10
KPX r colon 30
KPX r comma -50
KPX r hyphen -20
KPX r period -50
KPX r semicolon 30
KPX s comma -15
KPX s period -15
KPX s w -30
KPX semicolon space -50
KPX space T -50
KPX space V -50
KPX space W -40
KPX space Y -90
KPX space quotedblleft -30
KPX space quoteleft -60
KPX v a -25
KPX v comma -80
KPX v e -25
KPX v o -25
KPX v period -80
KPX w a -15
KPX w comma -60
KPX w e -10
KPX w o -10
KPX w period -60
KPX x e -30
KPX y a -20
KPX y comma -100
KPX y e -20
KPX y o -20
KPX y period -100
KPX z e -15
KPX z o -15
EndKernPairs
EndKernData
EndFontMetrics
)afm";

	static constexpr const char* HELVETICA_BOLD_OBLIQUE = R"afm(StartFontMetrics 4.1
FontName Helvetica-BoldOblique
FullName Helvetica Bold Oblique
FamilyName Helvetica
Weight Bold
ItalicAngle -12
IsFixedPitch false
FontBBox -174 -228 1114 962
EncodingScheme WinAnsiEncoding
CapHeight 718
XHeight 532
Ascender 718
Descender -207
StdVW 140
StartCharMetrics 223
C 32 ; WX 278 ; N space ;
C 33 ; WX 333 ; N exclam ;
C 34 ; WX 474 ; N quotedbl ;
C 35 ; WX 556 ; N numbersign ;
C 36 ; WX 556 ; N dollar ;
C 37 ; WX 889 ; N percent ;
C 38 ; WX 722 ; N ampersand ;
C 39 ; WX 238 ; N quotesingle ;
C 40 ; WX 333 ; N parenleft ;
C 41 ; WX 333 ; N parenright ;
C 42 ; WX 389 ; N asterisk ;
C 43 ; WX 584 ; N plus ;
C 44 ; WX 278 ; N comma ;
C 45 ; WX 333 ; N hyphen ;
C 46 ; WX 278 ; N period ;
C 47 ; WX 278 ; N slash ;
C 48 ; WX 556 ; N zero ;
C 49 ; WX 556 ; N one ;
C 50 ; WX 556 ; N two ;
C 51 ; WX 556 ; N three ;
C 52 ; WX 556 ; N four ;
C 53 ; WX 556 ; N five ;
C 54 ; WX 556 ; N six ;
C 55 ; WX 556 ; N seven ;
C 56 ; WX 556 ; N eight ;
C 57 ; WX 556 ; N nine ;
C 58 ; WX 333 ; N colon ;
C 59 ; WX 333 ; N semicolon ;
C 60 ; WX 584 ; N less ;
C 61 ; WX 584 ; N equal ;
C 62 ; WX 584 ; N greater ;
C 63 ; WX 611 ; N question ;
C 64 ; WX 975 ; N at ;
C 65 ; WX 722 ; N A ;
C 66 ; WX 722 ; N B ;
C 67 ; WX 722 ; N C ;
C 68 ; WX 722 ; N D ;
C 69 ; WX 667 ; N E ;
C 70 ; WX 611 ; N F ;
C 71 ; WX 778 ; N G ;
C 72 ; WX 722 ; N H ;
C 73 ; WX 278 ; N I ;
C 74 ; WX 556 ; N J ;
C 75 ; WX 722 ; N K ;
C 76 ; WX 611 ; N L ;
C 77 ; WX 833 ; N M ;
C 78 ; WX 722 ; N N ;
C 79 ; WX 778 ; N O ;
C 80 ; WX 667 ; N P ;
C 81 ; WX 778 ; N Q ;
C 82 ; WX 722 ; N R ;
C 83 ; WX 667 ; N S ;
C 84 ; WX 611 ; N T ;
C 85 ; WX 722 ; N U ;
C 86 ; WX 667 ; N V ;
C 87 ; WX 944 ; N W ;
C 88 ; WX 667 ; N X ;
C 89 ; WX 667 ; N Y ;
C 90 ; WX 611 ; N Z ;
C 91 ; WX 333 ; N bracketleft ;
C 92 ; WX 278 ; N backslash ;
C 93 ; WX 333 ; N bracketright ;
C 94 ; WX 584 ; N asciicircum ;
C 95 ; WX 556 ; N underscore ;
C 96 ; WX 333 ; N grave ;
C 97 ; WX 556 ; N a ;
C 98 ; WX 611 ; N b ;
C 99 ; WX 556 ; N c ;
C 100 ; WX 611 ; N d ;
C 101 ; WX 556 ; N e ;
C 102 ; WX 333 ; N f ;
C 103 ; WX 611 ; N g ;
C 104 ; WX 611 ; N h ;
C 105 ; WX 278 ; N i ;
C 106 ; WX 278 ; N j ;
C 107 ; WX 556 ; N k ;
C 108 ; WX 278 ; N l ;
C 109 ; WX 889 ; N m ;
C 110 ; WX 611 ; N n ;
C 111 ; WX 611 ; N o ;
C 112 ; WX 611 ; N p ;
C 113 ; WX 611 ; N q ;
C 114 ; WX 389 ; N r ;
C 115 ; WX 556 ; N s ;
C 116 ; WX 333 ; N t ;
C 117 ; WX 611 ; N u ;
C 118 ; WX 556 ; N v ;
C 119 ; WX 778 ; N w ;
C 120 ; WX 556 ; N x ;
C 121 ; WX 556 ; N y ;
C 122 ; WX 500 ; N z ;
C 123 ; WX 389 ; N braceleft ;
C 124 ; WX 280 ; N bar ;
C 125 ; WX 389 ; N braceright ;
C 126 ; WX 584 ; N asciitilde ;
C 128 ; WX 556 ; N Euro ;
C 130 ; WX 278 ; N quotesinglbase ;
C 131 ; WX 556 ; N florin ;
C 132 ; WX 500 ; N quotedblbase ;
C 133 ; WX 1000 ; N ellipsis ;
C 134 ; WX 556 ; N dagger ;
C 135 ; WX 556 ; N daggerdbl ;
C 136 ; WX 333 ; N circumflex ;
C 137 ; WX 1000 ; N perthousand ;
C 138 ; WX 667 ; N Scaron ;
C 139 ; WX 333 ; N guilsinglleft ;
C 140 ; WX 1000 ; N OE ;
C 142 ; WX 611 ; N Zcaron ;
C 145 ; WX 278 ; N quoteleft ;
C 146 ; WX 278 ; N quoteright ;
C 147 ; WX 500 ; N quotedblleft ;
C 148 ; WX 500 ; N quotedblright ;
C 149 ; WX 350 ; N bullet ;
C 150 ; WX 556 ; N endash ;
C 151 ; WX 1000 ; N emdash ;
C 152 ; WX 333 ; N tilde ;
C 153 ; WX 1000 ; N trademark ;
C 154 ; WX 556 ; N scaron ;
C 155 ; WX 333 ; N guilsinglright ;
C 156 ; WX 944 ; N oe ;
C 158 ; WX 500 ; N zcaron ;
C 159 ; WX 667 ; N Ydieresis ;
C 161 ; WX 333 ; N exclamdown ;
C 162 ; WX 556 ; N cent ;
C 163 ; WX 556 ; N sterling ;
C 164 ; WX 556 ; N currency ;
C 165 ; WX 556 ; N yen ;
C 166 ; WX 280 ; N brokenbar ;
C 167 ; WX 556 ; N section ;
C 168 ; WX 333 ; N dieresis ;
C 169 ; WX 737 ; N copyright ;
C 170 ; WX 370 ; N ordfeminine ;
C 171 ; WX 556 ; N guillemotleft ;
C 172 ; WX 584 ; N logicalnot ;
C 174 ; WX 737 ; N registered ;
C 175 ; WX 333 ; N macron ;
C 176 ; WX 400 ; N degree ;
C 177 ; WX 584 ; N plusminus ;
C 178 ; WX 333 ; N twosuperior ;
C 179 ; WX 333 ; N threesuperior ;
C 180 ; WX 333 ; N acute ;
C 181 ; WX 611 ; N mu ;
C 182 ; WX 556 ; N paragraph ;
C 183 ; WX 278 ; N periodcentered ;
C 184 ; WX 333 ; N cedilla ;
C 185 ; WX 333 ; N onesuperior ;
C 186 ; WX 365 ; N ordmasculine ;
C 187 ; WX 556 ; N guillemotright ;
C 188 ; WX 834 ; N onequarter ;
C 189 ; WX 834 ; N onehalf ;
C 190 ; WX 834 ; N threequarters ;
C 191 ; WX 611 ; N questiondown ;
C 192 ; WX 722 ; N Agrave ;
C 193 ; WX 722 ; N Aacute ;
C 194 ; WX 722 ; N Acircumflex ;
C 195 ; WX 722 ; N Atilde ;
C 196 ; WX 722 ; N Adieresis ;
C 197 ; WX 722 ; N Aring ;
C 198 ; WX 1000 ; N AE ;
C 199 ; WX 722 ; N Ccedilla ;
C 200 ; WX 667 ; N Egrave ;
C 201 ; WX 667 ; N Eacute ;
C 202 ; WX 667 ; N Ecircumflex ;
C 203 ; WX 667 ; N Edieresis ;
C 204 ; WX 278 ; N Igrave ;
C 205 ; WX 278 ; N Iacute ;
C 206 ; WX 278 ; N Icircumflex ;
C 207 ; WX 278 ; N Idieresis ;
C 208 ; WX 722 ; N Eth ;
C 209 ; WX 722 ; N Ntilde ;
C 210 ; WX 778 ; N Ograve ;
C 211 ; WX 778 ; N Oacute ;
C 212 ; WX 778 ; N Ocircumflex ;
C 213 ; WX 778 ; N Otilde ;
C 214 ; WX 778 ; N Odieresis ;
C 215 ; WX 584 ; N multiply ;
C 216 ; WX 778 ; N Oslash ;
C 217 ; WX 722 ; N Ugrave ;
C 218 ; WX 722 ; N Uacute ;
C 219 ; WX 722 ; N Ucircumflex ;
C 220 ; WX 722 ; N Udieresis ;
C 221 ; WX 667 ; N Yacute ;
C 222 ; WX 667 ; N Thorn ;
C 223 ; WX 611 ; N germandbls ;
C 224 ; WX 556 ; N agrave ;
C 225 ; WX 556 ; N aacute ;
C 226 ; WX 556 ; N acircumflex ;
C 227 ; WX 556 ; N atilde ;
C 228 ; WX 556 ; N adieresis ;
C 229 ; WX 556 ; N aring ;
C 230 ; WX 889 ; N ae ;
C 231 ; WX 556 ; N ccedilla ;
C 232 ; WX 556 ; N egrave ;
C 233 ; WX 556 ; N eacute ;
C 234 ; WX 556 ; N ecircumflex ;
C 235 ; WX 556 ; N edieresis ;
C 236 ; WX 278 ; N igrave ;
C 237 ; WX 278 ; N iacute ;
C 238 ; WX 278 ; N icircumflex ;
C 239 ; WX 278 ; N idieresis ;
C 240 ; WX 611 ; N eth ;
C 241 ; WX 611 ; N ntilde ;
C 242 ; WX 611 ; N ograve ;
C 243 ; WX 611 ; N oacute ;
C 244 ; WX 611 ; N ocircumflex ;
C 245 ; WX 611 ; N otilde ;
C 246 ; WX 611 ; N odieresis ;
C 247 ; WX 584 ; N divide ;
C 248 ; WX 611 ; N oslash ;
C 249 ; WX 611 ; N ugrave ;
C 250 ; WX 611 ; N uacute ;
C 251 ; WX 611 ; N ucircumflex ;
C 252 ; WX 611 ; N udieresis ;
C 253 ; WX 556 ; N yacute ;
C 254 ; WX 611 ; N thorn ;
C 255 ; WX 556 ; N ydieresis ;
C -1 ; WX 278 ; N dotlessi ;
C -1 ; WX 611 ; N fi ;
C -1 ; WX 611 ; N fl ;
C -1 ; WX 584 ; N minus ;
C -1 ; WX 167 ; N fraction ;
C -1 ; WX 556 ; N Lslash ;
C -1 ; WX 278 ; N lslash ;
EndCharMetrics
StartKernData
StartKernPairs 78
KPX A C -40
KPX A G -50
KPX A O -40
KPX A Q -40
KPX A T -90
KPX A U -50
KPX A V -80
KPX A W -60
KPX A Y -110
KPX A v -40
KPX A w -30
KPX A y -30
KPX D A -40
KPX D V -40
KPX D W -40
KPX D Y -70
KPX F A -80
KPX F comma -100
KPX F period -100
KPX L T -90
KPX L V -110
KPX L W -80
KPX L Y -120
KPX L y -30
KPX O A -50
KPX O T -40
KPX O V -50
KPX O W -50
KPX O Y -70
KPX P A -100
KPX P comma -120
KPX P period -120
KPX R T -20
KPX R V -50
KPX R W -40
KPX R Y -50
KPX T A -90
KPX T a -80
KPX T e -60
KPX T o -80
KPX T comma -80
KPX T period -80
KPX T r -80
KPX T u -90
KPX T y -60
KPX T w -60
KPX V A -80
KPX V a -60
KPX V e -50
KPX V o -90
KPX V comma -120
KPX V period -120
KPX W A -60
KPX W a -40
KPX W e -35
KPX W o -60
KPX W comma -80
KPX W period -80
KPX Y A -110
KPX Y a -100
KPX Y e -80
KPX Y o -100
KPX Y comma -100
KPX Y period -100
KPX Y u -100
KPX e v -15
KPX f quoteright 55
KPX o v -15
KPX o y -15
KPX quoteright s -50
KPX r comma -60
KPX r period -60
KPX v comma -80
KPX v period -80
KPX w comma -40
KPX w period -40
KPX y comma -80
KPX y period -80
EndKernPairs
EndKernData
EndFontMetrics
)afm";

	zst::str_view getAfmData(Face face)
	{
		switch(face)
		{
			case Face::Helvetica: return HELVETICA_REGULAR;
			case Face::HelveticaBold: return HELVETICA_BOLD;
			case Face::HelveticaOblique: return HELVETICA_OBLIQUE;
			case Face::HelveticaBoldOblique: return HELVETICA_BOLD_OBLIQUE;
		}
		return HELVETICA_REGULAR;
	}
}
