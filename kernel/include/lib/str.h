//
// str.h - integer to string conversion for the kernel's print streams
//

#ifndef HERONOS_STR_H
#define HERONOS_STR_H

extern const char* digits;// = "0123456789abcdefghijklmnopqrstuvwxyz";

//Writes value in the given base into str (which must be large enough) and returns the number of digits
template <class T>
int itoa(T value, char* str, int base){
    if(value == 0){
        str[0] = '0';
        str[1] = 0;
        return 1;
    }
    bool negative = false;
    if constexpr (static_cast<T>(-1) < static_cast<T>(0)){
        if(value < 0){
            negative = true;
            str[0] = '-';
            str++;
        }
    }
    int len = 0;
    while(value != 0){
        int digit = static_cast<int>(value % static_cast<T>(base));
        str[len] = digits[negative ? -digit : digit];
        value /= static_cast<T>(base);
        len++;
    }
    for(int i = 0; i < len/2; i++){
        char a = str[i];
        char b = str[len - i - 1];
        str[len - i - 1] = a;
        str[i] = b;
    }
    str[len] = 0;
    return len;
}

//Unsigned only, zero-pads to exactly length digits
template <class T>
void paddedItoa(T value, char* str, int base, int length){
    for(int i = 0; i < length; i++){
        str[i] = '0';
    }
    str[length] = 0;
    for(int i = length - 1; i >= 0 && value != 0; i--){
        str[i] = digits[value % static_cast<T>(base)];
        value /= static_cast<T>(base);
    }
}

#endif //HERONOS_STR_H
