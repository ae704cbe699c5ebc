#ifndef PNM_HPP
#define PNM_HPP

#include "image.hpp"

inline bool is_pnm(const Image::Header & header)
{
    const std::array<unsigned char, 2> pbm_header   {'P', '1'};
    const std::array<unsigned char, 2> pgm_header   {'P', '2'};
    const std::array<unsigned char, 2> ppm_header   {'P', '3'};
    const std::array<unsigned char, 2> pbm_b_header {'P', '4'};
    const std::array<unsigned char, 2> pgm_b_header {'P', '5'};
    const std::array<unsigned char, 2> ppm_b_header {'P', '6'};

    return std::equal(std::begin(pbm_header),   std::end(pbm_header),   std::begin(header), Image::header_cmp)
        || std::equal(std::begin(pgm_header),   std::end(pgm_header),   std::begin(header), Image::header_cmp)
        || std::equal(std::begin(ppm_header),   std::end(ppm_header),   std::begin(header), Image::header_cmp)
        || std::equal(std::begin(pbm_b_header), std::end(pbm_b_header), std::begin(header), Image::header_cmp)
        || std::equal(std::begin(pgm_b_header), std::end(pgm_b_header), std::begin(header), Image::header_cmp)
        || std::equal(std::begin(ppm_b_header), std::end(ppm_b_header), std::begin(header), Image::header_cmp);
}

// PBM, PGM, and PPM, in both plain (ASCII) and raw (binary) variants
class Pnm final: public Image
{
public:
    Pnm() = default;
    void open(std::istream & input) override;

private:
    void read_P1(std::istream & input);
    void read_P2(std::istream & input);
    void read_P3(std::istream & input);
    void read_P4(std::istream & input);
    void read_P5(std::istream & input);
    void read_P6(std::istream & input);
};
#endif // PNM_HPP
