#include "jpeg.hpp"

#include <array>
#include <stdexcept>
#include <string>

#include <csetjmp>
#include <cstdio>

#include <jpeglib.h>
#include <jerror.h>

struct my_jpeg_error: public jpeg_error_mgr
{
    jmp_buf setjmp_buffer;
    std::array<char, JMSG_LENGTH_MAX> message {};

    static void exit(j_common_ptr cinfo) noexcept
    {
        auto err = static_cast<my_jpeg_error *>(cinfo->err);
        err->format_message(cinfo, std::data(err->message));
        std::longjmp(err->setjmp_buffer, 1);
    }

    // swallow warnings and trace messages instead of printing them to stderr
    static void output(j_common_ptr) noexcept {}
};

class my_jpeg_source: public jpeg_source_mgr
{
public:
    explicit my_jpeg_source(std::istream & input):
        input_{input}
    {
        init_source = [](j_decompress_ptr){};
        fill_input_buffer = my_fill_input_buffer;
        skip_input_data = my_skip_input_data;
        resync_to_restart = jpeg_resync_to_restart;
        term_source = [](j_decompress_ptr){};
        bytes_in_buffer = 0;
        next_input_byte = nullptr;
    }

private:
    static boolean my_fill_input_buffer(j_decompress_ptr cinfo) noexcept
    {
        auto &src = *static_cast<my_jpeg_source*>(cinfo->src);

        src.input_.read(reinterpret_cast<char *>(std::data(src.buffer_)), std::size(src.buffer_));

        src.next_input_byte = std::data(src.buffer_);
        src.bytes_in_buffer = src.input_.gcount();

        if(src.input_.bad() || src.bytes_in_buffer == 0)
        {
            if(src.start_of_file_)
                ERREXIT(cinfo, JERR_INPUT_EMPTY);

            // insert a fake EOI marker, same as libjpeg's stdio source
            WARNMS(cinfo, JWRN_JPEG_EOF);
            src.buffer_[0] = 0xFF;
            src.buffer_[1] = JPEG_EOI;
            src.bytes_in_buffer = 2;
        }

        src.start_of_file_ = false;
        return true;
    }

    static void my_skip_input_data(j_decompress_ptr cinfo, long num_bytes) noexcept
    {
        if(num_bytes > 0)
        {
            auto &src = *static_cast<my_jpeg_source*>(cinfo->src);

            while(num_bytes > static_cast<long>(src.bytes_in_buffer))
            {
                num_bytes -= src.bytes_in_buffer;
                my_fill_input_buffer(cinfo);
            }

            src.next_input_byte += num_bytes;
            src.bytes_in_buffer -= num_bytes;
        }
    }

    std::istream & input_;
    std::array<JOCTET, 4096> buffer_;
    bool start_of_file_ {true};
};

class Libjpeg_read
{
public:
    explicit Libjpeg_read(std::istream & input):
        source_{input}
    {
        cinfo_.err = jpeg_std_error(&jerr);
        jerr.error_exit = my_jpeg_error::exit;
        jerr.output_message = my_jpeg_error::output;

        jpeg_create_decompress(&cinfo_);
        cinfo_.src = &source_;
    }
    ~Libjpeg_read()
    {
        jpeg_destroy_decompress(&cinfo_);
    }
    Libjpeg_read(const Libjpeg_read &) = delete;
    Libjpeg_read & operator=(const Libjpeg_read &) = delete;

    std::string error_message() const { return std::data(jerr.message); }

    operator jpeg_decompress_struct *() { return &cinfo_; }
    jpeg_decompress_struct * operator->() { return &cinfo_; }

    my_jpeg_error jerr;

private:
    my_jpeg_source source_;
    jpeg_decompress_struct cinfo_;
};

void Jpeg::open(std::istream & input)
{
    Libjpeg_read cinfo{input};
    jpeg_decompress_struct * dinfo = cinfo;

    // libjpeg longjmps here on error. Nothing with a destructor may be created
    // in this function after this point
    if(setjmp(cinfo.jerr.setjmp_buffer))
        throw std::runtime_error{"Error reading JPEG: " + cinfo.error_message()};

    jpeg_read_header(cinfo, true);
    cinfo->out_color_space = JCS_RGB;

    jpeg_start_decompress(cinfo);

    if(cinfo->output_components != 3)
        ERREXIT(dinfo, JERR_BAD_J_COLORSPACE);

    set_size(cinfo->output_width, cinfo->output_height);

    // decode straight into the image rows, then expand RGB to RGBA in place, back to front
    while(cinfo->output_scanline < cinfo->output_height)
    {
        auto row = cinfo->output_scanline;
        JSAMPROW ptr = row_buffer(row);
        jpeg_read_scanlines(cinfo, &ptr, 1);

        for(auto col = width_; col-- > 0;)
        {
            const auto r = ptr[col * 3], g = ptr[col * 3 + 1], b = ptr[col * 3 + 2];
            image_data_[row][col] = Color{r, g, b};
        }
    }

    jpeg_finish_decompress(cinfo);
}
