/* Copyright © 2026 The pdfdetext authors
 *
 * This file is part of pdfdetext.
 *
 * pdfdetext is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * pdfdetext is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#include "pdf-writer.hh"

#include <map>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>

#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Buffer.hh>
#include <qpdf/Pl_DCT.hh>
#include <qpdf/Pl_Flate.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

#include "i18n.hh"
#include "string-utils.hh"

namespace
{
  class JpegQuality : public Pl_DCT::CompressConfig
  {
  protected:
    int quality;
  public:
    explicit JpegQuality(int quality)
    : quality(quality)
    { }
    virtual void apply(jpeg_compress_struct *cinfo)
    {
      jpeg_set_quality(cinfo, this->quality, TRUE);
    }
  };
}

static QPDFObjectHandle make_real_box(double x1, double y1, double x2, double y2)
{
  QPDFObjectHandle box = QPDFObjectHandle::newArray();
  box.appendItem(QPDFObjectHandle::newReal(x1));
  box.appendItem(QPDFObjectHandle::newReal(y1));
  box.appendItem(QPDFObjectHandle::newReal(x2));
  box.appendItem(QPDFObjectHandle::newReal(y2));
  return box;
}

PdfWriter::PdfWriter(const std::string &path, const EncoderSettings &settings)
: path(path),
  settings(settings),
  n_pages(0),
  committed(false)
{
  this->pdf.emptyPDF();
}

QPDFObjectHandle PdfWriter::encode_image(const raster::Image &image)
{
  bool gray = image.get_color_mode() == raster::COLOR_GRAY;
  std::map<std::string, QPDFObjectHandle> dict;
  dict["/Type"] = QPDFObjectHandle::newName("/XObject");
  dict["/Subtype"] = QPDFObjectHandle::newName("/Image");
  dict["/Width"] = QPDFObjectHandle::newInteger(image.get_width());
  dict["/Height"] = QPDFObjectHandle::newInteger(image.get_height());
  dict["/BitsPerComponent"] = QPDFObjectHandle::newInteger(8);
  dict["/ColorSpace"] = QPDFObjectHandle::newName(gray ? "/DeviceGray" : "/DeviceRGB");
  QPDFObjectHandle stream = QPDFObjectHandle::newStream(&this->pdf);
  stream.replaceDict(QPDFObjectHandle::newDictionary(dict));
  Pl_Buffer sink("image");
  const char *filter;
  try
  {
    if (this->settings.format == EncoderSettings::FORMAT_JPEG)
    {
      JpegQuality quality(this->settings.jpeg_quality);
      Pl_DCT dct("jpeg", &sink,
        image.get_width(), image.get_height(),
        raster::get_n_components(image.get_color_mode()),
        gray ? JCS_GRAYSCALE : JCS_RGB,
        &quality
      );
      for (int y = 0; y < image.get_height(); y++)
        dct.write(image.get_row(y), image.get_row_size());
      dct.finish();
      filter = "/DCTDecode";
    }
    else
    {
      /* Compress right away rather than letting QPDFWriter do it,
       * so that the raw pixels need not be kept. */
      Pl_Flate flate("flate", &sink, Pl_Flate::a_deflate);
      for (int y = 0; y < image.get_height(); y++)
        flate.write(image.get_row(y), image.get_row_size());
      flate.finish();
      filter = "/FlateDecode";
    }
  }
  catch (const std::bad_alloc &)
  {
    throw WriteError(WriteError::ENCODING_FAILURE, string_printf(
      _("Out of memory while encoding page %d"), image.get_page_index() + 1));
  }
  catch (const std::runtime_error &ex)
  {
    throw WriteError(WriteError::ENCODING_FAILURE, string_printf(
      _("Unable to encode page %d: %s"), image.get_page_index() + 1, ex.what()));
  }
  stream.replaceStreamData(sink.getBufferSharedPointer(),
    QPDFObjectHandle::newName(filter), QPDFObjectHandle::newNull());
  return stream;
}

void PdfWriter::add_page(OutputPageSpec &spec)
{
  if (this->committed)
    throw std::logic_error("PdfWriter::add_page(): already committed");
  if (spec.image.is_released())
    throw std::logic_error("PdfWriter::add_page(): image was already released");
  if (!(spec.width > 0 && spec.height > 0))
    throw WriteError(WriteError::ENCODING_FAILURE, string_printf(
      _("Invalid size of page %d: %gx%g pt"), spec.get_page_index() + 1, spec.width, spec.height));
  QPDFObjectHandle image = this->encode_image(spec.image);
  spec.image.release();
  QPDFObjectHandle page = QPDFObjectHandle::parse(
    "<<"
    "  /Type /Page"
    "  /Resources <<"
    "    /XObject << >> "
    "  >>"
    "  /MediaBox null "
    "  /Contents null "
    ">>");
  page.replaceKey("/MediaBox", make_real_box(0, 0, spec.width, spec.height));
  std::string content =
    "q\n" +
    QUtil::double_to_string(spec.width) + " 0 0 " +
    QUtil::double_to_string(spec.height) + " 0 0 cm\n"
    "/Im0 Do\n"
    "Q\n";
  page.replaceKey("/Contents", QPDFObjectHandle::newStream(&this->pdf, content));
  page.getKey("/Resources").getKey("/XObject").replaceKey("/Im0", image);
  page = this->pdf.makeIndirectObject(page);
  QPDFPageDocumentHelper(this->pdf).addPage(QPDFPageObjectHelper(page), false);
  this->n_pages++;
}

void PdfWriter::commit()
{
  if (this->committed)
    throw std::logic_error("PdfWriter::commit(): already committed");
  try
  {
    QPDFWriter writer(this->pdf, this->path.c_str());
    writer.setDeterministicID(true);
    writer.setObjectStreamMode(qpdf_o_generate);
    writer.setCompressStreams(true);
    writer.setDecodeLevel(qpdf_dl_none);
    writer.write();
  }
  catch (const QPDFExc &ex)
  {
    throw WriteError(WriteError::IO_FAILURE, ex.what());
  }
  catch (const std::runtime_error &ex)
  {
    throw WriteError(WriteError::IO_FAILURE, string_printf(
      _("Unable to write %s: %s"), this->path.c_str(), ex.what()));
  }
  this->committed = true;
}

void PdfWriter::build(const std::string &path, const EncoderSettings &settings, std::vector<OutputPageSpec> &pages)
{
  PdfWriter writer(path, settings);
  for (OutputPageSpec &page : pages)
    writer.add_page(page);
  writer.commit();
}

// vim:ts=2 sts=2 sw=2 et
