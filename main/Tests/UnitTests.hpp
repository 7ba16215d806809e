#ifndef UNITTEST_HPP
#define UNITTEST_HPP

bool Test_SetThenGet();
bool Test_ValueEntryCreatedOnWrite();
bool Test_CompositeSingleLayer();
bool Test_ColorHidesTextBelow();
bool Test_CompositeImagesAndText();
bool Test_CompositeUnknownValue();
bool Test_SaveLoadRoundTrip();
bool Test_LoadAddsAndKeepsLayers();
bool Test_LoadRejectsBadData();
bool Test_MouseMapping();
bool Test_CellMetrics();
bool Test_MissingLayer();
bool Test_FillLayer();
bool Test_FillRowColumnReplace();
bool Test_OutOfBounds();
bool Test_NullInput();
bool Test_AutoRepaint();
bool Test_MouseFlag();
bool Test_MouseWatch();
bool Test_Utf8Glyph();
bool Test_ParseGridConfig();
bool Test_ParseGridConfigErrors();
bool Test_RenderGridImage();

#endif
