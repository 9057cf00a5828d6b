// Copyright 2026 The skitch Authors
// Tests for: Document (object mutations, selection, text editing,
//            replacement, rendering) and the snapshot codec

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "annotation/document.h"
#include "annotation/pixel_ops.h"
#include "annotation/shape.h"
#include "annotation/snapshot_codec.h"
#include "core/image.h"

using skitch::internal::ChangeKind;
using skitch::internal::ChangeListener;
using skitch::internal::DecodeDocument;
using skitch::internal::Document;
using skitch::internal::DocumentState;
using skitch::internal::Image;
using skitch::internal::ImagePatch;
using skitch::internal::Point;
using skitch::internal::RectShape;
using skitch::internal::ShapeStyle;
using skitch::internal::ShapeType;
using skitch::internal::Snapshot;
using skitch::internal::StrokeShape;
using skitch::internal::TextShape;

namespace {

constexpr ShapeStyle kRed = {0xFFFF0000, 2.0f};

class Recorder : public ChangeListener {
 public:
  void OnDocumentChanged(ChangeKind kind) override { kinds.push_back(kind); }
  std::vector<ChangeKind> kinds;
};

std::unique_ptr<Image> SolidImage(int w, int h, uint32_t argb) {
  auto image = Image::Create(w, h, kSkitchFormatBgra8);
  if (image) image->Fill(argb);
  return image;
}

// BGRA bytes of pixel (x, y).
uint32_t PixelAt(const Image& image, int x, int y) {
  const uint8_t* p = image.data() + static_cast<size_t>(y) * image.stride() +
                     static_cast<size_t>(x) * 4;
  return (static_cast<uint32_t>(p[3]) << 24) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[1]) << 8) | p[0];
}

std::vector<uint8_t> Bytes(const Document& doc) {
  Snapshot s;
  EXPECT_TRUE(doc.Serialize(&s));
  return s.bytes();
}

}  // namespace

class DocumentTest : public ::testing::Test {
 protected:
  DocumentTest() : doc_(200, 100, nullptr) { doc_.AddChangeListener(&rec_); }
  ~DocumentTest() override { doc_.RemoveChangeListener(&rec_); }

  int AddRect(int x, int y, int w, int h) {
    return doc_.AddObject(std::make_unique<RectShape>(x, y, w, h, kRed));
  }

  int AddText(int x, int y, const std::string& text) {
    return doc_.AddObject(
        std::make_unique<TextShape>(x, y, text, "Sans", 20, 0xFF000000));
  }

  Document doc_;
  Recorder rec_;
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST_F(DocumentTest, InitialState) {
  EXPECT_EQ(doc_.width(), 200);
  EXPECT_EQ(doc_.height(), 100);
  EXPECT_EQ(doc_.object_count(), 0);
  EXPECT_EQ(doc_.background(), nullptr);
  EXPECT_EQ(doc_.selected_id(), -1);
  EXPECT_FALSE(doc_.is_editing_text());
}

TEST(DocumentConstructionTest, InvalidSizeFallsBackToDefault) {
  Document doc(0, -5, nullptr);
  EXPECT_EQ(doc.width(), 1200);
  EXPECT_EQ(doc.height(), 750);
}

// ---------------------------------------------------------------------------
// Object mutations
// ---------------------------------------------------------------------------

TEST_F(DocumentTest, AddAssignsIncreasingIds) {
  EXPECT_EQ(AddRect(0, 0, 10, 10), 0);
  EXPECT_EQ(AddRect(0, 0, 10, 10), 1);
  EXPECT_EQ(doc_.object_count(), 2);
  EXPECT_EQ(rec_.kinds, (std::vector<ChangeKind>{ChangeKind::kObjectAdded,
                                                 ChangeKind::kObjectAdded}));
}

TEST_F(DocumentTest, AddNullFails) {
  EXPECT_EQ(doc_.AddObject(nullptr), -1);
  EXPECT_TRUE(rec_.kinds.empty());
}

TEST_F(DocumentTest, AddWithExplicitKind) {
  std::vector<Point> points = {{1, 1}, {5, 5}};
  doc_.AddObject(std::make_unique<StrokeShape>(points, kRed),
                 ChangeKind::kDrawCompleted);
  ASSERT_EQ(rec_.kinds.size(), 1u);
  EXPECT_EQ(rec_.kinds[0], ChangeKind::kDrawCompleted);
}

TEST_F(DocumentTest, RemoveObject) {
  int a = AddRect(0, 0, 10, 10);
  int b = AddRect(20, 20, 10, 10);
  doc_.Select(a);
  EXPECT_TRUE(doc_.RemoveObject(a));
  EXPECT_EQ(doc_.selected_id(), -1);
  EXPECT_EQ(doc_.FindObject(a), nullptr);
  EXPECT_NE(doc_.FindObject(b), nullptr);
  EXPECT_FALSE(doc_.RemoveObject(a));
  EXPECT_EQ(rec_.kinds.back(), ChangeKind::kObjectRemoved);
}

TEST_F(DocumentTest, MoveObject) {
  int id = AddRect(10, 10, 20, 20);
  rec_.kinds.clear();
  EXPECT_TRUE(doc_.MoveObject(id, 5, -3));
  auto b = doc_.FindObject(id)->GetBounds();
  EXPECT_EQ(b.x, 14);  // 10 + 5 minus half the stroke width.
  EXPECT_EQ(b.y, 6);
  EXPECT_EQ(rec_.kinds,
            (std::vector<ChangeKind>{ChangeKind::kObjectModified}));
}

TEST_F(DocumentTest, ZeroMoveIsSilent) {
  int id = AddRect(10, 10, 20, 20);
  rec_.kinds.clear();
  EXPECT_TRUE(doc_.MoveObject(id, 0, 0));
  EXPECT_TRUE(rec_.kinds.empty());
  EXPECT_FALSE(doc_.MoveObject(99, 1, 1));
}

TEST_F(DocumentTest, Recolor) {
  int id = AddRect(0, 0, 10, 10);
  EXPECT_TRUE(doc_.RecolorObject(id, 0xFF00FF00));
  EXPECT_EQ(doc_.FindObject(id)->style().stroke_color, 0xFF00FF00u);
  EXPECT_FALSE(doc_.RecolorObject(42, 0xFF00FF00));
}

TEST_F(DocumentTest, PatchIgnoresRecolor) {
  std::shared_ptr<const Image> img(SolidImage(4, 4, 0xFF0000FF));
  int id = doc_.AddObject(std::make_unique<ImagePatch>(0, 0, img));
  rec_.kinds.clear();
  EXPECT_FALSE(doc_.RecolorObject(id, 0xFF00FF00));
  EXPECT_TRUE(rec_.kinds.empty());
}

TEST_F(DocumentTest, HitTestPicksTopmost) {
  int lower = AddRect(10, 10, 50, 50);
  int upper = AddRect(30, 30, 50, 50);
  EXPECT_EQ(doc_.HitTest(15, 15), lower);
  EXPECT_EQ(doc_.HitTest(40, 40), upper);
  EXPECT_EQ(doc_.HitTest(150, 5), -1);
}

TEST_F(DocumentTest, SelectRequiresExistingObject) {
  EXPECT_FALSE(doc_.Select(0));
  int id = AddRect(0, 0, 10, 10);
  EXPECT_TRUE(doc_.Select(id));
  EXPECT_EQ(doc_.selected_id(), id);
  doc_.ClearSelection();
  EXPECT_EQ(doc_.selected_id(), -1);
}

// ---------------------------------------------------------------------------
// Text editing
// ---------------------------------------------------------------------------

TEST_F(DocumentTest, TextEditLifecycle) {
  int id = AddText(10, 10, "Type here");
  rec_.kinds.clear();
  ASSERT_TRUE(doc_.BeginTextEdit(id));
  EXPECT_TRUE(doc_.is_editing_text());
  EXPECT_EQ(doc_.editing_id(), id);
  EXPECT_EQ(doc_.selected_id(), id);

  EXPECT_TRUE(doc_.UpdateEditedText("hello"));
  EXPECT_TRUE(doc_.UpdateEditedText("hello"));  // Unchanged: no event.
  EXPECT_TRUE(doc_.EndTextEdit());
  EXPECT_FALSE(doc_.is_editing_text());
  EXPECT_EQ(rec_.kinds, (std::vector<ChangeKind>{
                            ChangeKind::kTextChanged,
                            ChangeKind::kTextEditExited}));
}

TEST_F(DocumentTest, BeginTextEditRejectsNonText) {
  int rect = AddRect(0, 0, 10, 10);
  EXPECT_FALSE(doc_.BeginTextEdit(rect));
  EXPECT_FALSE(doc_.BeginTextEdit(77));
  EXPECT_FALSE(doc_.UpdateEditedText("x"));
  EXPECT_FALSE(doc_.EndTextEdit());
}

TEST_F(DocumentTest, ExitInteractiveEditClearsSelection) {
  int id = AddText(0, 0, "abc");
  doc_.BeginTextEdit(id);
  rec_.kinds.clear();
  doc_.ExitInteractiveEdit();
  EXPECT_FALSE(doc_.is_editing_text());
  EXPECT_EQ(doc_.selected_id(), -1);
  EXPECT_EQ(rec_.kinds,
            (std::vector<ChangeKind>{ChangeKind::kTextEditExited}));

  rec_.kinds.clear();
  doc_.ExitInteractiveEdit();  // Nothing active.
  EXPECT_TRUE(rec_.kinds.empty());
}

TEST_F(DocumentTest, RemovingEditedTextEndsEdit) {
  int id = AddText(0, 0, "abc");
  doc_.BeginTextEdit(id);
  doc_.RemoveObject(id);
  EXPECT_FALSE(doc_.is_editing_text());
}

// ---------------------------------------------------------------------------
// Replacement
// ---------------------------------------------------------------------------

TEST_F(DocumentTest, ResetDropsEverything) {
  AddRect(0, 0, 10, 10);
  rec_.kinds.clear();
  ASSERT_TRUE(doc_.Reset(64, 32));
  EXPECT_EQ(doc_.width(), 64);
  EXPECT_EQ(doc_.height(), 32);
  EXPECT_EQ(doc_.object_count(), 0);
  EXPECT_EQ(rec_.kinds, (std::vector<ChangeKind>{ChangeKind::kReplaced}));
  EXPECT_EQ(AddRect(0, 0, 5, 5), 0);  // Ids restart.
}

TEST_F(DocumentTest, ResetRejectsInvalidSize) {
  EXPECT_FALSE(doc_.Reset(0, 10));
  EXPECT_FALSE(doc_.Reset(10, 40000));
  EXPECT_EQ(doc_.width(), 200);
  EXPECT_TRUE(rec_.kinds.empty());
}

TEST_F(DocumentTest, SetBackgroundImageAdoptsSize) {
  AddRect(0, 0, 10, 10);
  ASSERT_TRUE(doc_.SetBackgroundImage(SolidImage(30, 20, 0xFF112233)));
  EXPECT_EQ(doc_.width(), 30);
  EXPECT_EQ(doc_.height(), 20);
  EXPECT_EQ(doc_.object_count(), 0);
  ASSERT_NE(doc_.background(), nullptr);
  EXPECT_EQ(doc_.background()->format(), kSkitchFormatBgra8);
  EXPECT_EQ(rec_.kinds.back(), ChangeKind::kReplaced);
  EXPECT_FALSE(doc_.SetBackgroundImage(nullptr));
}

TEST_F(DocumentTest, SetBackgroundImageConvertsRgba) {
  auto rgba = Image::Create(2, 2, kSkitchFormatRgba8);
  rgba->Fill(0xFF102030);
  ASSERT_TRUE(doc_.SetBackgroundImage(std::move(rgba)));
  EXPECT_EQ(doc_.background()->format(), kSkitchFormatBgra8);
  EXPECT_EQ(PixelAt(*doc_.background(), 1, 1), 0xFF102030u);
}

// ---------------------------------------------------------------------------
// Render
// ---------------------------------------------------------------------------

TEST_F(DocumentTest, RenderBlankIsWhite) {
  auto out = doc_.Render();
  ASSERT_NE(out, nullptr);
  EXPECT_EQ(out->width(), 200);
  EXPECT_EQ(PixelAt(*out, 0, 0), 0xFFFFFFFFu);
  EXPECT_EQ(PixelAt(*out, 199, 99), 0xFFFFFFFFu);
}

TEST_F(DocumentTest, RenderDrawsBackgroundAndPatches) {
  ASSERT_TRUE(doc_.SetBackgroundImage(SolidImage(20, 20, 0xFFFF0000)));
  std::shared_ptr<const Image> patch(SolidImage(5, 5, 0xFF0000FF));
  doc_.AddObject(std::make_unique<ImagePatch>(10, 10, patch));
  // No renderer: vector objects are skipped.
  AddRect(0, 0, 4, 4);

  auto out = doc_.Render();
  ASSERT_NE(out, nullptr);
  EXPECT_EQ(PixelAt(*out, 2, 2), 0xFFFF0000u);
  EXPECT_EQ(PixelAt(*out, 12, 12), 0xFF0000FFu);
  EXPECT_EQ(PixelAt(*out, 16, 16), 0xFFFF0000u);
}

TEST(PixelOpsTest, MosaicAveragesBlocks) {
  auto image = Image::Create(4, 2, kSkitchFormatBgra8);
  image->Fill(0xFF000000);
  auto* px = image->mutable_data();
  px[0] = 200;  // Blue of (0, 0).
  skitch::internal::ApplyMosaic(image.get(), 0, 0, 2, 2, 2);
  EXPECT_EQ(PixelAt(*image, 1, 1), 0xFF000032u);  // 200 / 4
  EXPECT_EQ(PixelAt(*image, 3, 1), 0xFF000000u);  // Outside the region.
}

// ---------------------------------------------------------------------------
// Serialize / Restore
// ---------------------------------------------------------------------------

TEST_F(DocumentTest, SerializeIsDeterministic) {
  Document other(200, 100, nullptr);
  AddRect(1, 2, 3, 4);
  AddText(5, 6, "note");
  other.AddObject(std::make_unique<RectShape>(1, 2, 3, 4, kRed));
  other.AddObject(
      std::make_unique<TextShape>(5, 6, "note", "Sans", 20, 0xFF000000));
  EXPECT_EQ(Bytes(doc_), Bytes(other));

  doc_.MoveObject(0, 1, 0);
  EXPECT_NE(Bytes(doc_), Bytes(other));
}

TEST_F(DocumentTest, SelectionIsNotSerialized) {
  int id = AddText(0, 0, "abc");
  std::vector<uint8_t> before = Bytes(doc_);
  doc_.BeginTextEdit(id);
  EXPECT_EQ(Bytes(doc_), before);
}

TEST_F(DocumentTest, RestoreRebuildsDocument) {
  ASSERT_TRUE(doc_.SetBackgroundImage(SolidImage(40, 30, 0xFF336699)));
  AddRect(1, 1, 10, 10);
  int text = AddText(5, 5, "multi\nline");
  std::vector<Point> points = {{0, 0}, {3, 4}, {8, 1}};
  doc_.AddObject(std::make_unique<StrokeShape>(points, kRed));
  std::shared_ptr<const Image> patch(SolidImage(3, 3, 0xFF00FF00));
  doc_.AddObject(std::make_unique<ImagePatch>(2, 2, patch));
  doc_.RemoveObject(0);

  Snapshot snap;
  ASSERT_TRUE(doc_.Serialize(&snap));

  Document restored(10, 10, nullptr);
  Recorder rec;
  restored.AddChangeListener(&rec);
  ASSERT_TRUE(restored.Restore(snap));
  EXPECT_EQ(rec.kinds, (std::vector<ChangeKind>{ChangeKind::kRestored}));
  EXPECT_EQ(restored.width(), 40);
  EXPECT_EQ(restored.height(), 30);
  EXPECT_EQ(restored.object_count(), 3);
  ASSERT_NE(restored.FindObject(text), nullptr);
  EXPECT_EQ(restored.FindObject(text)->type(), ShapeType::kText);
  ASSERT_NE(restored.background(), nullptr);
  EXPECT_TRUE(restored.background()->SameContent(*doc_.background()));
  EXPECT_EQ(Bytes(restored), snap.bytes());

  // Next id continues after the highest restored id.
  EXPECT_EQ(restored.AddObject(std::make_unique<RectShape>(0, 0, 1, 1, kRed)),
            4);
  restored.RemoveChangeListener(&rec);
}

TEST_F(DocumentTest, RestoreResetsInteraction) {
  int id = AddText(0, 0, "abc");
  Snapshot snap;
  ASSERT_TRUE(doc_.Serialize(&snap));
  doc_.BeginTextEdit(id);
  ASSERT_TRUE(doc_.Restore(snap));
  EXPECT_FALSE(doc_.is_editing_text());
  EXPECT_EQ(doc_.selected_id(), -1);
}

TEST_F(DocumentTest, FailedRestoreLeavesDocumentUnchanged) {
  AddRect(0, 0, 10, 10);
  rec_.kinds.clear();
  std::vector<uint8_t> junk = {'n', 'o', 'p', 'e'};
  EXPECT_FALSE(doc_.Restore(Snapshot(junk)));
  EXPECT_FALSE(doc_.Restore(Snapshot()));
  EXPECT_EQ(doc_.object_count(), 1);
  EXPECT_TRUE(rec_.kinds.empty());
}

// ---------------------------------------------------------------------------
// Codec validation
// ---------------------------------------------------------------------------

class SnapshotCodecTest : public DocumentTest {
 protected:
  void SetUp() override {
    AddRect(1, 2, 3, 4);
    AddText(0, 0, "x");
    good_ = Bytes(doc_);
    DocumentState state;
    ASSERT_TRUE(DecodeDocument(good_.data(), good_.size(), &state));
  }

  bool Decodes(const std::vector<uint8_t>& bytes) {
    DocumentState state;
    return DecodeDocument(bytes.data(), bytes.size(), &state);
  }

  std::vector<uint8_t> good_;
};

TEST_F(SnapshotCodecTest, MagicIsSksn) {
  ASSERT_GE(good_.size(), 4u);
  EXPECT_EQ(std::string(good_.begin(), good_.begin() + 4), "SKSN");
}

TEST_F(SnapshotCodecTest, RejectsBadMagic) {
  std::vector<uint8_t> bytes = good_;
  bytes[0] = 'X';
  EXPECT_FALSE(Decodes(bytes));
}

TEST_F(SnapshotCodecTest, RejectsUnknownVersion) {
  std::vector<uint8_t> bytes = good_;
  bytes[4] ^= 0x02;
  EXPECT_FALSE(Decodes(bytes));
}

TEST_F(SnapshotCodecTest, RejectsTrailingBytes) {
  std::vector<uint8_t> bytes = good_;
  bytes.push_back(0);
  EXPECT_FALSE(Decodes(bytes));
}

TEST_F(SnapshotCodecTest, RejectsTruncation) {
  for (size_t len = 0; len < good_.size(); len += 3) {
    std::vector<uint8_t> bytes(good_.begin(), good_.begin() + len);
    EXPECT_FALSE(Decodes(bytes)) << "length " << len;
  }
}

TEST_F(SnapshotCodecTest, RejectsNullInput) {
  DocumentState state;
  EXPECT_FALSE(DecodeDocument(nullptr, 0, &state));
  EXPECT_FALSE(DecodeDocument(good_.data(), good_.size(), nullptr));
}
